#pragma once

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace cs::index {

class IndexError : public std::runtime_error {
public:
    explicit IndexError(const std::string& msg) : std::runtime_error(msg) {}
};

// Header/trailer mismatch, truncation or an offset pointing outside the file.
// Nothing read through the same handle can be trusted afterwards.
class CorruptIndex : public IndexError {
public:
    CorruptIndex(const std::filesystem::path& path, const std::string& detail)
        : IndexError("corrupt index " + path.string() + ": " + detail), path_(path) {}

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

class IoError : public IndexError {
public:
    IoError(const std::filesystem::path& path, const std::string& op, int err = errno)
        : IndexError(op + " " + path.string() + ": " + std::strerror(err)), path_(path), errno_(err) {}

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] int error() const { return errno_; }

private:
    std::filesystem::path path_;
    int errno_;
};

class AlreadyFlushed : public IndexError {
public:
    explicit AlreadyFlushed(const std::filesystem::path& path)
        : IndexError("index " + path.string() + " already flushed") {}
};

class NotFound : public IndexError {
public:
    explicit NotFound(const std::string& what) : IndexError(what + " not found") {}
};

class UnsortedInput : public IndexError {
public:
    UnsortedInput(const std::string& name, const std::string& previous)
        : IndexError("file names must be added in sorted order: " + name + " after " + previous) {}
};

class DuplicatePath : public IndexError {
public:
    explicit DuplicatePath(const std::string& name)
        : IndexError("path present in both merge sources: " + name), name_(name) {}

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
};

}
