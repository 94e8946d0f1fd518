#include "index/IndexSink.hpp"
#include "index/Format.hpp"
#include "index/errors.hpp"

#include <cerrno>

namespace cs::index {

IndexSink::IndexSink(const std::filesystem::path& dest, const std::filesystem::path& tmpDir)
    : dest_(dest),
      out_(dest),
      nameIndexTmp_(tmpDir, "csearch-nameindex"),
      postIndexTmp_(tmpDir, "csearch-postindex"),
      nameIndex_(nameIndexTmp_.path()),
      postIndex_(postIndexTmp_.path()) {}

uint32_t IndexSink::checkedOffset(const uint64_t off) const {
    if (off > format::MAX_OFFSET) throw IoError(dest_, "write", EFBIG);
    return static_cast<uint32_t>(off);
}

void IndexSink::writePaths(const std::vector<std::string>& paths) {
    if (stage_ != Stage::Start) throw std::logic_error("IndexSink: paths must be written first");

    out_.write(format::MAGIC);
    pathsOffset_ = out_.offset();
    for (const auto& p : paths) {
        out_.write(p);
        out_.writeByte(0);
    }
    out_.writeByte(0);

    namesOffset_ = out_.offset();
    stage_ = Stage::Names;
}

void IndexSink::addName(std::string_view name) {
    if (stage_ == Stage::Start) writePaths({});
    if (stage_ != Stage::Names) throw std::logic_error("IndexSink: names must precede posting lists");
    if (name.empty() || name.find('\0') != std::string_view::npos)
        throw std::invalid_argument("IndexSink: invalid file name");

    nameIndex_.writeUint32(checkedOffset(out_.offset() - namesOffset_));
    out_.write(name);
    out_.writeByte(0);
    ++nameCount_;
}

void IndexSink::endNames() {
    if (stage_ == Stage::Start) writePaths({});
    if (stage_ != Stage::Names) return;

    nameIndex_.writeUint32(checkedOffset(out_.offset() - namesOffset_));
    out_.writeByte(0);
    postingsOffset_ = out_.offset();
    stage_ = Stage::Postings;
}

void IndexSink::beginPostingList(const Trigram t) {
    endNames();
    if (stage_ != Stage::Postings || inList_) throw std::logic_error("IndexSink: unexpected posting list");
    if (haveTrigram_ && t <= trigram_) throw std::logic_error("IndexSink: trigrams out of order");

    trigram_ = t;
    haveTrigram_ = true;
    inList_ = true;
    lastId_ = -1;
    listCount_ = 0;
    listOffset_ = out_.offset() - postingsOffset_;
    out_.writeTrigram(t);
}

void IndexSink::addPosting(const FileId id) {
    if (!inList_) throw std::logic_error("IndexSink: posting outside a list");
    if (static_cast<int64_t>(id) <= lastId_) throw std::logic_error("IndexSink: posting list not increasing");

    out_.writeUvarint(static_cast<uint64_t>(static_cast<int64_t>(id) - lastId_));
    lastId_ = id;
    ++listCount_;
}

void IndexSink::endPostingList() {
    if (!inList_) throw std::logic_error("IndexSink: no open posting list");

    out_.writeUvarint(0);
    postIndex_.writeTrigram(trigram_);
    postIndex_.writeUint32(listCount_);
    postIndex_.writeUint32(checkedOffset(listOffset_));

    inList_ = false;
    ++trigramCount_;
    postingCount_ += listCount_;
}

void IndexSink::finish() {
    if (stage_ == Stage::Done) throw std::logic_error("IndexSink: already finished");
    if (inList_) throw std::logic_error("IndexSink: posting list still open");
    endNames();

    nameIndex_.close();
    postIndex_.close();

    const uint64_t nameIndexOffset = out_.offset();
    out_.append(nameIndexTmp_.path());
    const uint64_t postIndexOffset = out_.offset();
    out_.append(postIndexTmp_.path());

    out_.writeUint32(checkedOffset(pathsOffset_));
    out_.writeUint32(checkedOffset(namesOffset_));
    out_.writeUint32(checkedOffset(postingsOffset_));
    out_.writeUint32(checkedOffset(nameIndexOffset));
    out_.writeUint32(checkedOffset(postIndexOffset));
    out_.write(format::TRAILER_MAGIC);

    out_.close(true);
    stage_ = Stage::Done;
}

}
