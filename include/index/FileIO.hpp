#pragma once

#include "index/Trigram.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cs::index {

constexpr size_t IO_BUFFER_SIZE = 64 * 1024;

// Buffered, offset-tracking writer over a POSIX descriptor. A file that is
// destroyed while still open is assumed incomplete and is unlinked; close()
// is the only way to keep it.
class OutputFile {
public:
    explicit OutputFile(std::filesystem::path path);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    void write(const void* data, size_t n);
    void write(std::string_view s) { write(s.data(), s.size()); }
    void writeByte(uint8_t b);
    void writeUint32(uint32_t v);
    void writeTrigram(Trigram t);
    void writeUvarint(uint64_t v);

    // Copies the whole content of another file to the current position.
    void append(const std::filesystem::path& other);

    [[nodiscard]] uint64_t offset() const { return offset_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] bool isOpen() const { return fd_ >= 0; }

    void flush();
    void close(bool sync = false);

private:
    std::filesystem::path path_;
    int fd_ = -1;
    std::vector<uint8_t> buf_;
    uint64_t offset_ = 0;
};

class InputFile {
public:
    explicit InputFile(std::filesystem::path path);
    ~InputFile();

    InputFile(const InputFile&) = delete;
    InputFile& operator=(const InputFile&) = delete;

    // Returns 0 at end of file.
    size_t read(void* dst, size_t n);

    // false at end of file
    bool readByte(uint8_t& b);
    bool readUvarint(uint64_t& v);
    bool readCString(std::string& out);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    bool fill();

    std::filesystem::path path_;
    int fd_ = -1;
    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
    size_t end_ = 0;
};

// Owns a uniquely named scratch file and removes it on destruction.
class TempFile {
public:
    TempFile(const std::filesystem::path& dir, std::string_view prefix);
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

std::filesystem::path resolveTempDir(const std::filesystem::path& configured);

}
