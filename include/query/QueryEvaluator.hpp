#pragma once

#include "index/IndexReader.hpp"
#include "query/Query.hpp"

#include <vector>

namespace cs::query {

// Resolves a trigram query to the sorted ids of candidate files. The result
// is a superset of the files that actually match; callers confirm with a
// real regexp match.
class QueryEvaluator {
public:
    explicit QueryEvaluator(const index::IndexReader& reader) : reader_(reader) {}

    [[nodiscard]] std::vector<index::FileId> candidates(const Query& q) const;

    // Only ids in the sorted list within are considered.
    [[nodiscard]] std::vector<index::FileId> candidates(const Query& q,
                                                        const std::vector<index::FileId>& within) const;

private:
    using IdList = std::vector<index::FileId>;

    IdList eval(const Query& q, const IdList* within) const;

    IdList postingList(index::Trigram t, const IdList* within) const;
    IdList postingAnd(const IdList& list, index::Trigram t) const;
    IdList postingOr(const IdList& list, index::Trigram t, const IdList* within) const;

    const index::IndexReader& reader_;
};

}
