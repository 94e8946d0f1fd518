#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

namespace cs::index {

// Read-only private mapping of a whole file. An empty file maps to an empty
// span.
class MappedFile {
public:
    explicit MappedFile(std::filesystem::path path);
    ~MappedFile();

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    MappedFile(MappedFile&&) = delete;
    MappedFile& operator=(MappedFile&&) = delete;

    [[nodiscard]] std::span<const uint8_t> data() const { return {data_, size_}; }
    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
};

}
