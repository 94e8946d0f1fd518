#include "index/MappedFile.hpp"
#include "index/errors.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cs::index {

MappedFile::MappedFile(std::filesystem::path path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) throw IoError(path_, "open");

    struct stat sb{};
    if (::fstat(fd_, &sb) != 0) {
        const int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw IoError(path_, "stat", err);
    }

    size_ = static_cast<size_t>(sb.st_size);
    if (size_ == 0) return;

    void* p = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (p == MAP_FAILED) {
        const int err = errno;
        ::close(fd_);
        fd_ = -1;
        size_ = 0;
        throw IoError(path_, "mmap", err);
    }
    data_ = static_cast<const uint8_t*>(p);
}

MappedFile::~MappedFile() {
    if (data_ && ::munmap(const_cast<uint8_t*>(data_), size_) != 0 && log::Registry::isInitialized())
        log::Registry::index()->error("[MappedFile] Failed to munmap {}: {}", path_.string(), std::strerror(errno));
    if (fd_ >= 0) ::close(fd_);
}

}
