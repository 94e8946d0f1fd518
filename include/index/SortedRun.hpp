#pragma once

#include "index/FileIO.hpp"
#include "index/Trigram.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <queue>
#include <vector>

namespace cs::index {

// A (trigram, file id) pair packed so that integer order is (trigram, id) order.
using PackedPosting = uint64_t;

constexpr PackedPosting packPosting(const Trigram t, const FileId id) {
    return static_cast<uint64_t>(t) << 32 | id;
}

constexpr Trigram packedTrigram(const PackedPosting p) { return static_cast<Trigram>(p >> 32); }
constexpr FileId packedFileId(const PackedPosting p) { return static_cast<FileId>(p); }

// Runs are stored as uvarint deltas between consecutive packed pairs.
void writeRun(const std::filesystem::path& path, const std::vector<PackedPosting>& sorted);

class PostingSource {
public:
    virtual ~PostingSource() = default;
    virtual bool next(PackedPosting& out) = 0;
};

class RunFileSource : public PostingSource {
public:
    explicit RunFileSource(const std::filesystem::path& path) : in_(path) {}
    bool next(PackedPosting& out) override;

private:
    InputFile in_;
    PackedPosting last_ = 0;
};

class MemorySource : public PostingSource {
public:
    explicit MemorySource(const std::vector<PackedPosting>& sorted) : data_(sorted) {}
    bool next(PackedPosting& out) override;

private:
    const std::vector<PackedPosting>& data_;
    size_t pos_ = 0;
};

// k-way merge of sorted sources into one ascending, duplicate-free stream.
class RunMerger {
public:
    explicit RunMerger(std::vector<std::unique_ptr<PostingSource>> sources);

    bool next(PackedPosting& out);

private:
    struct Head {
        PackedPosting value;
        size_t source;
        bool operator>(const Head& o) const { return value > o.value; }
    };

    void pull(size_t source);

    std::vector<std::unique_ptr<PostingSource>> sources_;
    std::priority_queue<Head, std::vector<Head>, std::greater<>> heap_;
    bool haveLast_ = false;
    PackedPosting last_ = 0;
};

}
