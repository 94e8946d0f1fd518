#include "index/FileIO.hpp"
#include "index/Varint.hpp"
#include "index/errors.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <unistd.h>

namespace cs::index {

static void writen(const int fd, const void* b, size_t n, const std::filesystem::path& path) {
    const auto* p = static_cast<const uint8_t*>(b);
    while (n) {
        const ssize_t w = ::write(fd, p, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw IoError(path, "write");
        }
        p += w;
        n -= static_cast<size_t>(w);
    }
}

static size_t readSome(const int fd, void* b, const size_t n, const std::filesystem::path& path) {
    for (;;) {
        const ssize_t r = ::read(fd, b, n);
        if (r >= 0) return static_cast<size_t>(r);
        if (errno != EINTR) throw IoError(path, "read");
    }
}

OutputFile::OutputFile(std::filesystem::path path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) throw IoError(path_, "create");
    buf_.reserve(IO_BUFFER_SIZE);
}

OutputFile::~OutputFile() {
    if (fd_ < 0) return;
    ::close(fd_);
    fd_ = -1;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

void OutputFile::write(const void* data, const size_t n) {
    if (buf_.size() + n > IO_BUFFER_SIZE) flush();
    if (n >= IO_BUFFER_SIZE) writen(fd_, data, n, path_);
    else {
        const auto* p = static_cast<const uint8_t*>(data);
        buf_.insert(buf_.end(), p, p + n);
    }
    offset_ += n;
}

void OutputFile::writeByte(const uint8_t b) {
    if (buf_.size() + 1 > IO_BUFFER_SIZE) flush();
    buf_.push_back(b);
    ++offset_;
}

void OutputFile::writeUint32(const uint32_t v) {
    const uint8_t b[4] = {
        static_cast<uint8_t>(v >> 24), static_cast<uint8_t>(v >> 16),
        static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v)
    };
    write(b, sizeof(b));
}

void OutputFile::writeTrigram(const Trigram t) {
    const uint8_t b[3] = {static_cast<uint8_t>(t >> 16), static_cast<uint8_t>(t >> 8), static_cast<uint8_t>(t)};
    write(b, sizeof(b));
}

void OutputFile::writeUvarint(const uint64_t v) {
    uint8_t tmp[kMaxVarintLen64];
    write(tmp, putUvarint(tmp, v));
}

void OutputFile::append(const std::filesystem::path& other) {
    flush();
    const int in = ::open(other.c_str(), O_RDONLY | O_CLOEXEC);
    if (in < 0) throw IoError(other, "open");

    std::vector<uint8_t> chunk(IO_BUFFER_SIZE);
    try {
        for (;;) {
            const size_t n = readSome(in, chunk.data(), chunk.size(), other);
            if (n == 0) break;
            writen(fd_, chunk.data(), n, path_);
            offset_ += n;
        }
    } catch (...) {
        ::close(in);
        throw;
    }
    ::close(in);
}

void OutputFile::flush() {
    if (buf_.empty()) return;
    writen(fd_, buf_.data(), buf_.size(), path_);
    buf_.clear();
}

void OutputFile::close(const bool sync) {
    if (fd_ < 0) return;
    flush();
    if (sync && ::fsync(fd_) != 0) throw IoError(path_, "fsync");
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) throw IoError(path_, "close");
}

InputFile::InputFile(std::filesystem::path path) : path_(std::move(path)), buf_(IO_BUFFER_SIZE) {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) throw IoError(path_, "open");
}

InputFile::~InputFile() {
    if (fd_ >= 0) ::close(fd_);
}

bool InputFile::fill() {
    pos_ = 0;
    end_ = readSome(fd_, buf_.data(), buf_.size(), path_);
    return end_ > 0;
}

size_t InputFile::read(void* dst, const size_t n) {
    if (pos_ == end_) {
        if (n >= buf_.size()) return readSome(fd_, dst, n, path_);
        if (!fill()) return 0;
    }
    const size_t take = std::min(n, end_ - pos_);
    std::memcpy(dst, buf_.data() + pos_, take);
    pos_ += take;
    return take;
}

bool InputFile::readByte(uint8_t& b) {
    if (pos_ == end_ && !fill()) return false;
    b = buf_[pos_++];
    return true;
}

bool InputFile::readUvarint(uint64_t& v) {
    v = 0;
    unsigned shift = 0;
    for (size_t i = 0; i < kMaxVarintLen64; ++i) {
        uint8_t b;
        if (!readByte(b)) {
            if (i == 0) return false;
            throw IndexError("truncated varint in " + path_.string());
        }
        v |= static_cast<uint64_t>(b & 0x7F) << shift;
        if (b < 0x80) return true;
        shift += 7;
    }
    throw IndexError("varint overflow in " + path_.string());
}

bool InputFile::readCString(std::string& out) {
    out.clear();
    uint8_t b;
    while (readByte(b)) {
        if (b == 0) return true;
        out.push_back(static_cast<char>(b));
    }
    if (!out.empty()) throw IndexError("unterminated string in " + path_.string());
    return false;
}

TempFile::TempFile(const std::filesystem::path& dir, std::string_view prefix) {
    static std::mutex genMutex;
    static boost::uuids::random_generator gen;
    boost::uuids::uuid id;
    {
        std::scoped_lock lock(genMutex);
        id = gen();
    }
    path_ = dir / (std::string(prefix) + "-" + boost::uuids::to_string(id));
}

TempFile::~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

std::filesystem::path resolveTempDir(const std::filesystem::path& configured) {
    if (!configured.empty()) return configured;
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) return "/tmp";
    return dir;
}

}
