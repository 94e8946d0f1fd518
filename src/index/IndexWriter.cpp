#include "index/IndexWriter.hpp"
#include "index/IndexSink.hpp"
#include "index/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cerrno>

namespace cs::index {

namespace fs = std::filesystem;
using log::Registry;

namespace {

// Names and paths are stored NUL-terminated, and an empty entry ends a list.
bool storable(const std::string& s) {
    return !s.empty() && s.find('\0') == std::string::npos;
}

}

IndexWriter::IndexWriter(fs::path path, WriterOptions options)
    : path_(std::move(path)),
      options_(std::move(options)),
      tmpDir_(resolveTempDir(options_.tmp_dir)),
      extractor_(options_.limits),
      namesTmp_(tmpDir_, "csearch-names"),
      names_(std::make_unique<OutputFile>(namesTmp_.path())),
      chunk_(IO_BUFFER_SIZE),
      maxBuffered_(std::max<size_t>(1, options_.sort_buffer_bytes / sizeof(PackedPosting))) {
    buffer_.reserve(std::min<size_t>(maxBuffered_, 1 << 20));
}

void IndexWriter::addPaths(const std::vector<std::string>& paths) {
    for (const auto& p : paths)
        if (!storable(p)) throw std::invalid_argument("IndexWriter: invalid indexed path");
    paths_.insert(paths_.end(), paths.begin(), paths.end());
    std::sort(paths_.begin(), paths_.end());
    paths_.erase(std::unique(paths_.begin(), paths_.end()), paths_.end());
}

void IndexWriter::checkOrder(const std::string& name) const {
    if (flushed_) throw AlreadyFlushed(path_);
    if (!storable(name)) throw std::invalid_argument("IndexWriter: invalid file name");
    if (nextId_ > 0 && name <= lastName_) throw UnsortedInput(name, lastName_);
}

std::optional<SkipReason> IndexWriter::skip(const std::string& name, const SkipReason reason) {
    ++stats_.skipped[static_cast<size_t>(reason)];
    if (Registry::isInitialized())
        Registry::index()->debug("[IndexWriter] [addFile] Skipping {}: {}", name, to_string(reason));
    return reason;
}

std::optional<SkipReason> IndexWriter::addFile(const fs::path& path) {
    const std::string name = path.string();
    checkOrder(name);

    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec) throw IoError(path, "stat", ec.value());
    if (fs::is_directory(st)) throw IoError(path, "read", EISDIR);
    if (!fs::is_regular_file(st)) throw IoError(path, "read", EINVAL);

    const auto size = fs::file_size(path, ec);
    if (ec) throw IoError(path, "stat", ec.value());
    if (size > options_.limits.max_file_len) return skip(name, SkipReason::TooLarge);

    InputFile in(path);
    extractor_.reset();
    for (;;) {
        const size_t n = in.read(chunk_.data(), chunk_.size());
        if (n == 0) break;
        if (const auto r = extractor_.feed({chunk_.data(), n})) return skip(name, *r);
    }
    if (const auto r = extractor_.finish()) return skip(name, *r);

    commit(name);
    return std::nullopt;
}

std::optional<SkipReason> IndexWriter::addFile(const std::string& name, std::string_view content) {
    checkOrder(name);
    if (content.size() > options_.limits.max_file_len) return skip(name, SkipReason::TooLarge);
    if (const auto r = extractor_.extract(content)) return skip(name, *r);

    commit(name);
    return std::nullopt;
}

void IndexWriter::commit(const std::string& name) {
    if (nextId_ == UINT32_MAX) throw IndexError("IndexWriter: too many files for one index");
    const FileId id = nextId_++;

    names_->write(name);
    names_->writeByte(0);
    lastName_ = name;

    const auto& trigrams = extractor_.trigrams();
    for (const Trigram t : trigrams) {
        buffer_.push_back(packPosting(t, id));
        if (buffer_.size() >= maxBuffered_) spill();
    }

    ++stats_.files;
    stats_.bytes += extractor_.bytesSeen();
    stats_.pairs += trigrams.size();
}

void IndexWriter::spill() {
    std::sort(buffer_.begin(), buffer_.end());

    auto run = std::make_unique<TempFile>(tmpDir_, "csearch-run");
    writeRun(run->path(), buffer_);
    runs_.push_back(std::move(run));
    ++stats_.runs;

    if (Registry::isInitialized())
        Registry::index()->debug("[IndexWriter] [spill] Run {} with {} pairs", runs_.size(), buffer_.size());
    buffer_.clear();
}

void IndexWriter::flush() {
    if (flushed_) throw AlreadyFlushed(path_);
    flushed_ = true;

    std::sort(buffer_.begin(), buffer_.end());
    names_->close();

    IndexSink sink(path_, tmpDir_);
    sink.writePaths(paths_);

    {
        InputFile names(namesTmp_.path());
        std::string name;
        while (names.readCString(name)) sink.addName(name);
    }

    std::vector<std::unique_ptr<PostingSource>> sources;
    sources.reserve(runs_.size() + 1);
    for (const auto& run : runs_) sources.push_back(std::make_unique<RunFileSource>(run->path()));
    sources.push_back(std::make_unique<MemorySource>(buffer_));

    RunMerger merger(std::move(sources));
    PackedPosting p;
    bool open = false;
    Trigram current = 0;
    while (merger.next(p)) {
        const Trigram t = packedTrigram(p);
        if (!open || t != current) {
            if (open) sink.endPostingList();
            sink.beginPostingList(t);
            current = t;
            open = true;
        }
        sink.addPosting(packedFileId(p));
    }
    if (open) sink.endPostingList();

    sink.finish();

    stats_.trigrams = sink.trigramCount();
    stats_.postings = sink.postingCount();
    stats_.indexBytes = sink.bytesWritten();

    buffer_.clear();
    buffer_.shrink_to_fit();
    runs_.clear();

    if (Registry::isInitialized())
        Registry::index()->info("[IndexWriter] [flush] Wrote {}: {} files, {} trigrams, {} postings, {} runs, {} bytes",
                                path_.string(), stats_.files, stats_.trigrams, stats_.postings, stats_.runs,
                                stats_.indexBytes);
}

}
