#pragma once

#include "index/FileIO.hpp"
#include "index/SortedRun.hpp"
#include "index/TrigramExtractor.hpp"

#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cs::index {

constexpr size_t DEFAULT_SORT_BUFFER_BYTES = 64 * 1024 * 1024;

struct WriterOptions {
    ExtractorLimits limits;
    size_t sort_buffer_bytes = DEFAULT_SORT_BUFFER_BYTES;
    std::filesystem::path tmp_dir; // empty: system temp dir
};

struct WriterStats {
    uint32_t files = 0;
    uint64_t bytes = 0;
    std::array<uint32_t, 4> skipped{};
    uint32_t runs = 0;
    uint64_t pairs = 0;
    uint32_t trigrams = 0;
    uint64_t postings = 0;
    uint64_t indexBytes = 0;

    [[nodiscard]] uint32_t skippedFor(SkipReason r) const { return skipped[static_cast<size_t>(r)]; }
    [[nodiscard]] uint32_t skippedTotal() const { return skipped[0] + skipped[1] + skipped[2] + skipped[3]; }
};

// Builds one index file. Files must be added in strictly increasing name
// order and at most once each; the writer validates the order but leaves
// de-duplication to the caller.
//
// (trigram, id) pairs are buffered up to sort_buffer_bytes, then sorted and
// spilled as a run to a temp file. flush() k-way merges the runs with the
// in-memory remainder, so peak memory is bounded by the buffer regardless of
// how many files are indexed.
class IndexWriter {
public:
    explicit IndexWriter(std::filesystem::path path, WriterOptions options = {});

    IndexWriter(const IndexWriter&) = delete;
    IndexWriter& operator=(const IndexWriter&) = delete;

    void addPaths(const std::vector<std::string>& paths);

    // nullopt when the file was added. Throws IoError when it cannot be read
    // and UnsortedInput when it is out of order; neither poisons the writer.
    std::optional<SkipReason> addFile(const std::filesystem::path& path);
    std::optional<SkipReason> addFile(const std::string& name, std::string_view content);

    void flush();

    [[nodiscard]] bool flushed() const { return flushed_; }
    [[nodiscard]] const WriterStats& stats() const { return stats_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    void checkOrder(const std::string& name) const;
    std::optional<SkipReason> skip(const std::string& name, SkipReason reason);
    void commit(const std::string& name);
    void spill();

    std::filesystem::path path_;
    WriterOptions options_;
    std::filesystem::path tmpDir_;
    TrigramExtractor extractor_;

    std::vector<std::string> paths_;

    TempFile namesTmp_;
    std::unique_ptr<OutputFile> names_;
    std::string lastName_;
    FileId nextId_ = 0;

    std::vector<uint8_t> chunk_;
    std::vector<PackedPosting> buffer_;
    size_t maxBuffered_;
    std::vector<std::unique_ptr<TempFile>> runs_;

    WriterStats stats_;
    bool flushed_ = false;
};

}
