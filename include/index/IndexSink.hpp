#pragma once

#include "index/FileIO.hpp"
#include "index/Trigram.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cs::index {

// Streams one index file section by section. Both the writer and the merger
// produce their output through it, so every index shares one layout.
//
// Call order: writePaths, addName*, (beginPostingList, addPosting*,
// endPostingList)*, finish. The name and posting tables are staged in temp
// files and appended at finish. An unfinished sink removes its output.
class IndexSink {
public:
    IndexSink(const std::filesystem::path& dest, const std::filesystem::path& tmpDir);

    IndexSink(const IndexSink&) = delete;
    IndexSink& operator=(const IndexSink&) = delete;

    void writePaths(const std::vector<std::string>& paths);
    void addName(std::string_view name);

    void beginPostingList(Trigram t);
    void addPosting(FileId id);
    void endPostingList();

    void finish();

    [[nodiscard]] uint32_t nameCount() const { return nameCount_; }
    [[nodiscard]] uint32_t trigramCount() const { return trigramCount_; }
    [[nodiscard]] uint64_t postingCount() const { return postingCount_; }
    [[nodiscard]] uint64_t bytesWritten() const { return out_.offset(); }

private:
    enum class Stage { Start, Names, Postings, Done };

    void endNames();
    uint32_t checkedOffset(uint64_t off) const;

    std::filesystem::path dest_;
    OutputFile out_;
    TempFile nameIndexTmp_;
    TempFile postIndexTmp_;
    OutputFile nameIndex_;
    OutputFile postIndex_;

    Stage stage_ = Stage::Start;
    uint64_t pathsOffset_ = 0;
    uint64_t namesOffset_ = 0;
    uint64_t postingsOffset_ = 0;

    uint32_t nameCount_ = 0;
    uint32_t trigramCount_ = 0;
    uint64_t postingCount_ = 0;

    bool inList_ = false;
    bool haveTrigram_ = false;
    Trigram trigram_ = 0;
    int64_t lastId_ = -1;
    uint32_t listCount_ = 0;
    uint64_t listOffset_ = 0;
};

}
