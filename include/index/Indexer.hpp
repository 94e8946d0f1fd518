#pragma once

#include "fs/DirWalker.hpp"
#include "fs/ExcludeList.hpp"
#include "index/IndexWriter.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cs::index {

constexpr size_t DEFAULT_CHANNEL_CAPACITY = 4096;

struct IndexerOptions {
    WriterOptions writer;
    fs::WalkOptions walk;
    size_t channel_capacity = DEFAULT_CHANNEL_CAPACITY;
    bool log_skipped = false;
    // Called on the indexing thread after each file is indexed or skipped.
    std::function<void(const std::filesystem::path&)> on_file;
};

struct IndexerStats {
    uint64_t received = 0;
    uint64_t duplicates = 0;
    uint64_t errors = 0;
    WriterStats writer;
    fs::WalkStats walk;
};

// Builds one index from a set of roots. A walker thread streams file paths
// through a bounded channel to the calling thread, which owns the writer,
// drops paths it has already seen and isolates per-file failures.
class Indexer {
public:
    Indexer(std::filesystem::path output, IndexerOptions options, fs::ExcludeList excludes = {},
            std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    // roots as returned by fs::prepareRoots. Returns false when interrupted,
    // in which case nothing is left at the output path.
    bool build(const std::vector<std::string>& roots);

    [[nodiscard]] const IndexerStats& stats() const { return stats_; }

private:
    [[nodiscard]] bool interrupted() const { return interruptFlag_ && interruptFlag_->load(); }

    std::filesystem::path output_;
    IndexerOptions options_;
    fs::ExcludeList excludes_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
    IndexerStats stats_;
};

}
