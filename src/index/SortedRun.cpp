#include "index/SortedRun.hpp"

namespace cs::index {

void writeRun(const std::filesystem::path& path, const std::vector<PackedPosting>& sorted) {
    OutputFile out(path);
    PackedPosting last = 0;
    for (const PackedPosting p : sorted) {
        out.writeUvarint(p - last);
        last = p;
    }
    out.close();
}

bool RunFileSource::next(PackedPosting& out) {
    uint64_t delta;
    if (!in_.readUvarint(delta)) return false;
    last_ += delta;
    out = last_;
    return true;
}

bool MemorySource::next(PackedPosting& out) {
    if (pos_ == data_.size()) return false;
    out = data_[pos_++];
    return true;
}

RunMerger::RunMerger(std::vector<std::unique_ptr<PostingSource>> sources) : sources_(std::move(sources)) {
    for (size_t i = 0; i < sources_.size(); ++i) pull(i);
}

void RunMerger::pull(const size_t source) {
    PackedPosting v;
    if (sources_[source]->next(v)) heap_.push({v, source});
}

bool RunMerger::next(PackedPosting& out) {
    while (!heap_.empty()) {
        const Head h = heap_.top();
        heap_.pop();
        pull(h.source);
        if (haveLast_ && h.value == last_) continue;
        haveLast_ = true;
        last_ = h.value;
        out = h.value;
        return true;
    }
    return false;
}

}
