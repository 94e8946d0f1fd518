#include "index/IndexMerger.hpp"
#include "index/IndexReader.hpp"
#include "index/IndexSink.hpp"
#include "index/FileIO.hpp"
#include "index/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cs::index {

namespace fs = std::filesystem;
using log::Registry;

namespace {

constexpr FileId DROPPED = std::numeric_limits<FileId>::max();

bool under(const std::string_view name, const std::string_view root) {
    if (!name.starts_with(root)) return false;
    if (name.size() == root.size()) return true;
    return root.ends_with('/') || name[root.size()] == '/';
}

bool underAny(const std::string_view name, const std::vector<std::string>& roots) {
    return std::any_of(roots.begin(), roots.end(), [&](const std::string& r) { return under(name, r); });
}

bool sameFile(const fs::path& a, const fs::path& b) {
    std::error_code ec1, ec2;
    if (fs::equivalent(a, b, ec1)) return true;
    const auto ca = fs::weakly_canonical(a, ec1);
    const auto cb = fs::weakly_canonical(b, ec2);
    return !ec1 && !ec2 && ca == cb;
}

// Streams the remapped, surviving ids of one source posting list.
class RemappedList {
public:
    RemappedList() = default;
    RemappedList(const PostingList& list, const std::vector<FileId>& table)
        : it_(list.begin()), table_(&table) { skipDropped(); }

    [[nodiscard]] bool done() const { return it_ == PostingList::iterator(); }
    [[nodiscard]] FileId head() const { return (*table_)[*it_]; }

    void pop() {
        ++it_;
        skipDropped();
    }

private:
    void skipDropped() {
        while (!done() && (*table_)[*it_] == DROPPED) ++it_;
    }

    PostingList::iterator it_;
    const std::vector<FileId>* table_ = nullptr;
};

}

MergeStats merge(const fs::path& dest, const fs::path& src1, const fs::path& src2, const MergeMode mode,
                 const fs::path& tmpDir) {
    if (sameFile(dest, src1) || sameFile(dest, src2))
        throw std::invalid_argument("merge: destination " + dest.string() + " is also a source");

    const IndexReader ix1(src1);
    const IndexReader ix2(src2);

    MergeStats stats;
    stats.files1 = ix1.numNames();
    stats.files2 = ix2.numNames();

    const auto paths1 = ix1.indexedPaths().toVector();
    const auto paths2 = ix2.indexedPaths().toVector();

    std::vector<std::string> paths;
    paths.reserve(paths1.size() + paths2.size());
    std::set_union(paths1.begin(), paths1.end(), paths2.begin(), paths2.end(), std::back_inserter(paths));

    std::vector<FileId> map1(ix1.numNames(), DROPPED);
    std::vector<FileId> map2(ix2.numNames(), DROPPED);

    IndexSink sink(dest, resolveTempDir(tmpDir));
    sink.writePaths(paths);

    // Names: two-pointer merge assigning new ids in sorted order.
    {
        FileId i = 0, j = 0, next = 0;
        auto n1 = ix1.names().begin(), n2 = ix2.names().begin();
        const auto end = ix1.names().end();

        auto skipSuperseded = [&]() {
            if (mode != MergeMode::Supersede) return;
            while (n1 != end && underAny(*n1, paths2)) {
                ++stats.dropped;
                ++n1;
                ++i;
            }
        };

        skipSuperseded();
        while (n1 != end || n2 != end) {
            if (n1 != end && n2 != end && *n1 == *n2) throw DuplicatePath(std::string(*n1));

            if (n2 == end || (n1 != end && *n1 < *n2)) {
                sink.addName(*n1);
                map1[i++] = next++;
                ++n1;
                skipSuperseded();
            } else {
                sink.addName(*n2);
                map2[j++] = next++;
                ++n2;
            }
        }
        if (i != ix1.numNames() || j != ix2.numNames()) {
            const auto& bad = i != ix1.numNames() ? ix1 : ix2;
            bad.corrupt("name list and name index disagree");
        }
        stats.files = next;
    }

    // Postings: merge-join of the two posting indexes.
    {
        size_t a = 0, b = 0;
        while (a < ix1.numTrigrams() || b < ix2.numTrigrams()) {
            const auto e1 = a < ix1.numTrigrams() ? std::optional(ix1.trigramEntry(a)) : std::nullopt;
            const auto e2 = b < ix2.numTrigrams() ? std::optional(ix2.trigramEntry(b)) : std::nullopt;

            Trigram t = 0;
            RemappedList l1, l2;
            if (e1 && (!e2 || e1->trigram <= e2->trigram)) {
                t = e1->trigram;
                l1 = RemappedList(ix1.postingList(*e1), map1);
                ++a;
            } else {
                t = e2->trigram;
            }
            if (e2 && e2->trigram == t) {
                l2 = RemappedList(ix2.postingList(*e2), map2);
                ++b;
            }

            bool open = false;
            auto emit = [&](const FileId id) {
                if (!open) {
                    sink.beginPostingList(t);
                    open = true;
                }
                sink.addPosting(id);
            };

            while (!l1.done() || !l2.done()) {
                if (l2.done() || (!l1.done() && l1.head() < l2.head())) {
                    emit(l1.head());
                    l1.pop();
                } else {
                    emit(l2.head());
                    l2.pop();
                }
            }
            if (open) sink.endPostingList();
        }
    }

    sink.finish();
    stats.trigrams = sink.trigramCount();
    stats.postings = sink.postingCount();

    if (Registry::isInitialized())
        Registry::index()->info("[IndexMerger] [merge] {} + {} -> {}: {} files ({} superseded), {} trigrams",
                                src1.string(), src2.string(), dest.string(), stats.files, stats.dropped, stats.trigrams);
    return stats;
}

}
