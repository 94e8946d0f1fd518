#pragma once

#include <string>
#include <vector>

namespace cs::query {

// Sorted, de-duplicated strings. Trigram sets hold 3-byte strings; the
// analyzer also uses the type for its exact/prefix/suffix sets, where suffix
// sets are ordered by their reversed bytes.
using StringSet = std::vector<std::string>;

enum class QueryOp {
    All,  // no constraint
    None, // matches nothing
    And,
    Or
};

// Boolean query over trigrams: op applied to every trigram and every sub
// query. Built through andQuery/orQuery, which keep it simplified.
struct Query {
    QueryOp op = QueryOp::All;
    StringSet trigrams;
    std::vector<Query> subs;

    static Query all() { return {}; }
    static Query none() { return {QueryOp::None, {}, {}}; }

    // q implies r: every file matching q also matches r.
    [[nodiscard]] bool implies(const Query& r) const;

    // "abc" "bcd" for AND, ("abc"|"bcd") for OR, + for All, - for None.
    [[nodiscard]] std::string toString() const;

    bool operator==(const Query& o) const = default;
};

Query andQuery(Query q, Query r);
Query orQuery(Query q, Query r);

// q AND (OR over the strings of t of the AND of each string's trigrams).
// A string shorter than three bytes constrains nothing, so q is returned.
Query andTrigrams(Query q, const StringSet& t);

void cleanSet(StringSet& s, bool isSuffix = false);
StringSet unionSets(StringSet s, const StringSet& t, bool isSuffix = false);
StringSet crossSets(const StringSet& s, const StringSet& t, bool isSuffix = false);
bool isSubsetOf(const StringSet& s, const StringSet& t);
size_t minLen(const StringSet& s);

}
