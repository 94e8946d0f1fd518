#include "query/Query.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace cs::query {

namespace {

bool suffixLess(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(a.rbegin(), a.rend(), b.rbegin(), b.rend());
}

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (const char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (c < 0x20 || c >= 0x7F) out += fmt::format("\\x{:02x}", c);
                else out += ch;
        }
    }
    return out + "\"";
}

bool isAtom(const Query& q) { return q.trigrams.size() == 1 && q.subs.empty(); }

bool trigramsImply(const StringSet& t, const Query& q) {
    switch (q.op) {
        case QueryOp::Or:
            for (const auto& sub : q.subs)
                if (trigramsImply(t, sub)) return true;
            for (const auto& tri : t)
                if (std::binary_search(q.trigrams.begin(), q.trigrams.end(), tri)) return true;
            return false;
        case QueryOp::And:
            for (const auto& sub : q.subs)
                if (!trigramsImply(t, sub)) return false;
            return isSubsetOf(q.trigrams, t);
        default:
            return false;
    }
}

Query andOr(Query q, Query r, const QueryOp op) {
    if (q.trigrams.empty() && q.subs.size() == 1) q = Query(q.subs.front());
    if (r.trigrams.empty() && r.subs.size() == 1) r = Query(r.subs.front());

    // If q implies r, q AND r is q and q OR r is r.
    if (q.implies(r)) return op == QueryOp::And ? q : r;
    if (r.implies(q)) return op == QueryOp::And ? r : q;

    const bool qAtom = isAtom(q);
    const bool rAtom = isAtom(r);

    // Merge queries that share the op, or can be made to.
    if (q.op == op && (r.op == op || rAtom)) {
        q.trigrams = unionSets(std::move(q.trigrams), r.trigrams);
        q.subs.insert(q.subs.end(), std::make_move_iterator(r.subs.begin()), std::make_move_iterator(r.subs.end()));
        return q;
    }
    if (r.op == op && qAtom) {
        r.trigrams = unionSets(std::move(r.trigrams), q.trigrams);
        return r;
    }
    if (qAtom && rAtom) {
        q.op = op;
        q.trigrams = unionSets(std::move(q.trigrams), r.trigrams);
        return q;
    }

    if (q.op == op) {
        q.subs.push_back(std::move(r));
        return q;
    }
    if (r.op == op) {
        r.subs.push_back(std::move(q));
        return r;
    }

    // An AND of ORs or an OR of ANDs: factor out common trigrams.
    //   (abc|def|ghi) AND (abc|def|jkl) => (abc|def) OR (ghi AND jkl)
    //   (abc def ghi) OR (abc def jkl)  => (abc def) AND (ghi OR jkl)
    StringSet common, qRest, rRest;
    std::set_intersection(q.trigrams.begin(), q.trigrams.end(), r.trigrams.begin(), r.trigrams.end(),
                          std::back_inserter(common));
    if (!common.empty()) {
        std::set_difference(q.trigrams.begin(), q.trigrams.end(), common.begin(), common.end(),
                            std::back_inserter(qRest));
        std::set_difference(r.trigrams.begin(), r.trigrams.end(), common.begin(), common.end(),
                            std::back_inserter(rRest));
        q.trigrams = std::move(qRest);
        r.trigrams = std::move(rRest);

        Query s = andOr(std::move(q), std::move(r), op);
        const QueryOp other = op == QueryOp::And ? QueryOp::Or : QueryOp::And;
        return andOr(Query{other, std::move(common), {}}, std::move(s), other);
    }

    Query out{op, {}, {}};
    out.subs.push_back(std::move(q));
    out.subs.push_back(std::move(r));
    return out;
}

}

void cleanSet(StringSet& s, const bool isSuffix) {
    if (isSuffix) std::sort(s.begin(), s.end(), suffixLess);
    else std::sort(s.begin(), s.end());
    s.erase(std::unique(s.begin(), s.end()), s.end());
}

StringSet unionSets(StringSet s, const StringSet& t, const bool isSuffix) {
    s.insert(s.end(), t.begin(), t.end());
    cleanSet(s, isSuffix);
    return s;
}

StringSet crossSets(const StringSet& s, const StringSet& t, const bool isSuffix) {
    StringSet p;
    p.reserve(s.size() * t.size());
    for (const auto& a : s)
        for (const auto& b : t) p.push_back(a + b);
    cleanSet(p, isSuffix);
    return p;
}

bool isSubsetOf(const StringSet& s, const StringSet& t) {
    return std::all_of(s.begin(), s.end(),
                       [&](const std::string& x) { return std::find(t.begin(), t.end(), x) != t.end(); });
}

size_t minLen(const StringSet& s) {
    if (s.empty()) return 0;
    size_t m = s.front().size();
    for (const auto& x : s) m = std::min(m, x.size());
    return m;
}

bool Query::implies(const Query& r) const {
    // False implies everything; everything implies true.
    if (op == QueryOp::None || r.op == QueryOp::All) return true;
    if (op == QueryOp::All || r.op == QueryOp::None) return false;

    if (op == QueryOp::And || (op == QueryOp::Or && isAtom(*this))) return trigramsImply(trigrams, r);

    return op == QueryOp::Or && r.op == QueryOp::Or && !trigrams.empty() && subs.empty() &&
           isSubsetOf(trigrams, r.trigrams);
}

std::string Query::toString() const {
    if (op == QueryOp::None) return "-";
    if (op == QueryOp::All) return "+";
    if (isAtom(*this)) return quote(trigrams.front());

    const bool isAnd = op == QueryOp::And;
    const char* tjoin = isAnd ? " " : "|";
    const char* sjoin = isAnd ? " " : ")|(";

    std::string s = isAnd ? "" : "(";
    for (size_t i = 0; i < trigrams.size(); ++i) {
        if (i) s += tjoin;
        s += quote(trigrams[i]);
    }
    for (size_t i = 0; i < subs.size(); ++i) {
        if (i || !trigrams.empty()) s += sjoin;
        s += subs[i].toString();
    }
    if (!isAnd) s += ")";
    return s;
}

Query andQuery(Query q, Query r) { return andOr(std::move(q), std::move(r), QueryOp::And); }
Query orQuery(Query q, Query r) { return andOr(std::move(q), std::move(r), QueryOp::Or); }

Query andTrigrams(Query q, const StringSet& t) {
    if (minLen(t) < 3) return q;

    Query any = Query::none();
    for (const auto& s : t) {
        StringSet tri;
        for (size_t i = 0; i + 3 <= s.size(); ++i) tri.push_back(s.substr(i, 3));
        cleanSet(tri);
        any = orQuery(std::move(any), Query{QueryOp::And, std::move(tri), {}});
    }
    return andQuery(std::move(q), std::move(any));
}

}
