#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace cs::fs {

// Shell glob patterns (fnmatch) for files and directories to leave out.
// Patterns without a '/' match the entry's own name; the others match the
// whole path.
class ExcludeList {
public:
    ExcludeList() = default;
    explicit ExcludeList(const std::vector<std::string>& patterns);

    // Ignores blank lines and lines starting with '#'.
    void add(std::string pattern);

    // One pattern per line. Throws std::runtime_error if the file cannot be read.
    void loadFile(const std::filesystem::path& file);

    [[nodiscard]] bool matches(const std::filesystem::path& path) const;

    [[nodiscard]] const std::vector<std::string>& patterns() const { return patterns_; }
    [[nodiscard]] bool empty() const { return patterns_.empty(); }

private:
    std::vector<std::string> patterns_;
};

// Non-empty, trimmed lines of a text file (exclude lists, --filelist).
std::vector<std::string> readLines(const std::filesystem::path& file);

}
