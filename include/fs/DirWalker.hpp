#pragma once

#include "fs/ExcludeList.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace cs::fs {

struct WalkOptions {
    bool follow_symlinks = true;
};

struct WalkStats {
    uint64_t files = 0;
    uint64_t dirs = 0;
    uint64_t excluded = 0;
    uint64_t errors = 0;
};

// Returning false stops the walk.
using Visitor = std::function<bool(const std::filesystem::path&)>;

// Yields the regular files under a root in byte-wise order of their full
// paths, the order the index stores names in. Within a directory entries are
// ordered by name with a '/' appended to directories, so "a.txt" comes before
// the contents of "a/".
//
// Unreadable directories and broken links are logged and skipped.
class DirWalker {
public:
    explicit DirWalker(ExcludeList excludes = {}, WalkOptions options = {});

    // false when the visitor stopped the walk
    bool walk(const std::filesystem::path& root, const Visitor& visit);

    [[nodiscard]] const WalkStats& stats() const { return stats_; }

private:
    struct Entry {
        std::string key;
        std::filesystem::path path;
        bool dir;
    };

    bool walkDir(const std::filesystem::path& dir, const Visitor& visit);
    std::vector<Entry> list(const std::filesystem::path& dir);

    ExcludeList excludes_;
    WalkOptions options_;
    WalkStats stats_;

    // (device, inode) of the directories being walked, to stop symlink cycles.
    std::set<std::pair<uint64_t, uint64_t>> active_;
};

// Absolute, normalized roots in walk order with duplicates and roots nested
// inside another root removed.
std::vector<std::string> prepareRoots(const std::vector<std::string>& paths);

}
