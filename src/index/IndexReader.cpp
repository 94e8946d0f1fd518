#include "index/IndexReader.hpp"
#include "index/Format.hpp"
#include "index/Varint.hpp"
#include "index/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cstring>

namespace cs::index {

using namespace format;

void StringList::iterator::load() {
    if (!p_ || p_ >= end_ || *p_ == 0) {
        p_ = nullptr;
        cur_ = {};
        return;
    }
    const auto* nul = static_cast<const uint8_t*>(std::memchr(p_, 0, static_cast<size_t>(end_ - p_)));
    const auto* stop = nul ? nul : end_;
    cur_ = {reinterpret_cast<const char*>(p_), static_cast<size_t>(stop - p_)};
}

std::vector<std::string> StringList::toVector() const {
    std::vector<std::string> out;
    for (const auto s : *this) out.emplace_back(s);
    return out;
}

PostingList::iterator::iterator(const PostingList* list)
    : reader_(list->reader_), pos_(list->begin_), end_(list->end_), count_(list->count_), done_(false) {
    advance();
}

void PostingList::iterator::advance() {
    if (done_) return;

    uint64_t delta = 0;
    const size_t n = getUvarint({pos_, static_cast<size_t>(end_ - pos_)}, delta);
    if (n == 0) reader_->corrupt("truncated posting list");
    pos_ += n;

    if (delta == 0) {
        if (decoded_ != count_)
            reader_->corrupt("posting list holds " + std::to_string(decoded_) + " ids, index says " +
                             std::to_string(count_));
        done_ = true;
        return;
    }

    if (decoded_ >= count_) reader_->corrupt("posting list longer than its count");
    const auto limit = static_cast<uint64_t>(static_cast<int64_t>(reader_->numNames()) - 1 - prev_);
    if (delta > limit) reader_->corrupt("posting list names a file id out of range");

    prev_ += static_cast<int64_t>(delta);
    id_ = static_cast<FileId>(prev_);
    ++decoded_;
}

std::vector<FileId> PostingList::toVector() const {
    std::vector<FileId> out;
    out.reserve(std::min(count_, reader_ ? reader_->numNames() : 0));
    for (auto it = begin(); it != end(); ++it) out.push_back(*it);
    return out;
}

IndexReader::IndexReader(std::filesystem::path path) : file_(std::move(path)) {
    const auto data = file_.data();
    base_ = data.data();
    const size_t size = data.size();

    if (size < MAGIC.size() + TRAILER_SIZE) corrupt("file too short");
    if (std::memcmp(base_, MAGIC.data(), MAGIC.size()) != 0) corrupt("bad header magic");
    if (std::memcmp(base_ + size - TRAILER_MAGIC.size(), TRAILER_MAGIC.data(), TRAILER_MAGIC.size()) != 0)
        corrupt("bad trailer magic");

    trailerOffset_ = size - TRAILER_SIZE;
    const uint8_t* t = base_ + trailerOffset_;
    pathsOffset_ = readUint32(t);
    namesOffset_ = readUint32(t + 4);
    postingsOffset_ = readUint32(t + 8);
    nameIndexOffset_ = readUint32(t + 12);
    postIndexOffset_ = readUint32(t + 16);

    if (pathsOffset_ < MAGIC.size() || namesOffset_ <= pathsOffset_ || postingsOffset_ <= namesOffset_ ||
        nameIndexOffset_ < postingsOffset_ || postIndexOffset_ < nameIndexOffset_ ||
        trailerOffset_ < postIndexOffset_)
        corrupt("section offsets out of order");

    if (base_[namesOffset_ - 1] != 0) corrupt("unterminated path list");
    if (base_[postingsOffset_ - 1] != 0) corrupt("unterminated name list");

    const uint64_t nameIndexLen = postIndexOffset_ - nameIndexOffset_;
    if (nameIndexLen < NAME_ENTRY_SIZE || nameIndexLen % NAME_ENTRY_SIZE != 0) corrupt("bad name index size");
    numNames_ = static_cast<uint32_t>(nameIndexLen / NAME_ENTRY_SIZE - 1);

    const uint64_t postIndexLen = trailerOffset_ - postIndexOffset_;
    if (postIndexLen % POST_ENTRY_SIZE != 0) corrupt("bad posting index size");
    numTrigrams_ = postIndexLen / POST_ENTRY_SIZE;

    if (nameOffset(numNames_) >= postingsOffset_ - namesOffset_) corrupt("name index points past the names");

    if (log::Registry::isInitialized())
        log::Registry::index()->debug("[IndexReader] Opened {}: {} files, {} trigrams, {} bytes",
                                      file_.path().string(), numNames_, numTrigrams_, size);
}

void IndexReader::corrupt(const std::string& detail) const {
    throw CorruptIndex(file_.path(), detail);
}

StringList IndexReader::indexedPaths() const {
    return {base_ + pathsOffset_, base_ + namesOffset_};
}

StringList IndexReader::names() const {
    return {base_ + namesOffset_, base_ + postingsOffset_};
}

uint32_t IndexReader::nameOffset(const FileId id) const {
    return readUint32(base_ + nameIndexOffset_ + static_cast<uint64_t>(id) * NAME_ENTRY_SIZE);
}

std::string_view IndexReader::name(const FileId id) const {
    if (id >= numNames_) throw NotFound("file id " + std::to_string(id));

    const uint64_t off = nameOffset(id);
    const uint64_t next = nameOffset(id + 1);
    if (off >= next || next > postingsOffset_ - namesOffset_) corrupt("bad name index entry " + std::to_string(id));

    const uint8_t* p = base_ + namesOffset_;
    if (p[next - 1] != 0) corrupt("unterminated name " + std::to_string(id));
    return {reinterpret_cast<const char*>(p + off), static_cast<size_t>(next - off - 1)};
}

std::optional<FileId> IndexReader::fileId(const std::string_view path) const {
    uint32_t lo = 0, hi = numNames_;
    while (lo < hi) {
        const uint32_t mid = lo + (hi - lo) / 2;
        const auto n = name(mid);
        if (n == path) return mid;
        if (n < path) lo = mid + 1;
        else hi = mid;
    }
    return std::nullopt;
}

TrigramEntry IndexReader::trigramEntry(const size_t i) const {
    if (i >= numTrigrams_) throw NotFound("trigram entry " + std::to_string(i));
    const uint8_t* e = base_ + postIndexOffset_ + i * POST_ENTRY_SIZE;
    const TrigramEntry entry{readTrigram(e), readUint32(e + 3), readUint32(e + 7)};
    if (entry.count > numNames_)
        corrupt("posting count " + std::to_string(entry.count) + " for " + trigramToString(entry.trigram) +
                " exceeds the number of files");
    return entry;
}

std::vector<Trigram> IndexReader::trigrams() const {
    std::vector<Trigram> out;
    out.reserve(numTrigrams_);
    for (size_t i = 0; i < numTrigrams_; ++i)
        out.push_back(readTrigram(base_ + postIndexOffset_ + i * POST_ENTRY_SIZE));
    return out;
}

PostingList IndexReader::postingList(const Trigram t) const {
    size_t lo = 0, hi = numTrigrams_;
    while (lo < hi) {
        const size_t mid = lo + (hi - lo) / 2;
        const Trigram m = readTrigram(base_ + postIndexOffset_ + mid * POST_ENTRY_SIZE);
        if (m == t) return postingList(trigramEntry(mid));
        if (m < t) lo = mid + 1;
        else hi = mid;
    }
    return {};
}

PostingList IndexReader::postingList(const TrigramEntry& entry) const {
    if (entry.count > numNames_) corrupt("posting count out of range for " + trigramToString(entry.trigram));
    const uint64_t start = postingsOffset_ + entry.offset;
    if (start + 3 > nameIndexOffset_) corrupt("posting list offset out of bounds for " + trigramToString(entry.trigram));
    if (readTrigram(base_ + start) != entry.trigram)
        corrupt("posting list for " + trigramToString(entry.trigram) + " starts with the wrong trigram");
    return {this, base_ + start + 3, base_ + nameIndexOffset_, entry.count};
}

}
