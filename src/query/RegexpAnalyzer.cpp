#include "query/RegexpAnalyzer.hpp"
#include "log/Registry.hpp"

#include <cstdint>

namespace cs::query {

namespace {

// What is known about the strings a subexpression matches. With exact set,
// those are all the strings; otherwise every match starts with a string in
// prefix and ends with one in suffix. match must hold for every file
// containing a match.
struct Info {
    bool canEmpty = false;
    StringSet exact;
    StringSet prefix;
    StringSet suffix;
    Query match;

    [[nodiscard]] bool hasExact() const { return !exact.empty(); }

    void addExact() {
        if (hasExact()) match = andTrigrams(std::move(match), exact);
    }

    void simplify(bool force);
    void simplifySet(StringSet& s, bool isSuffix);
};

Info anyMatch() { return {true, {}, {""}, {""}, Query::all()}; }
Info anyChar() { return {false, {}, {""}, {""}, Query::all()}; }
Info noMatch() { return {false, {}, {}, {}, Query::none()}; }
Info emptyString() { return {true, {""}, {}, {}, Query::all()}; }

void Info::simplify(const bool force) {
    cleanSet(exact);

    // Too many exact strings, or long enough to be worth trigrams on their
    // own: keep them as trigrams plus prefix/suffix pieces.
    const size_t ml = minLen(exact);
    if (exact.size() > MAX_EXACT || (ml >= 3 && force) || ml >= 4) {
        addExact();
        for (const auto& s : exact) {
            if (s.size() < 3) {
                prefix.push_back(s);
                suffix.push_back(s);
            } else {
                prefix.push_back(s.substr(0, 2));
                suffix.push_back(s.substr(s.size() - 2));
            }
        }
        exact.clear();
    }

    if (!hasExact()) {
        simplifySet(prefix, false);
        simplifySet(suffix, true);
    }
}

void Info::simplifySet(StringSet& s, const bool isSuffix) {
    StringSet t = std::move(s);
    cleanSet(t, isSuffix);

    match = andTrigrams(std::move(match), t);

    // Cut strings down to two bytes, then keep shortening while the set is
    // too large.
    for (size_t n = 3; n == 3 || t.size() > MAX_SET; --n) {
        for (auto& str : t)
            if (str.size() >= n) str = isSuffix ? str.substr(str.size() - n + 1) : str.substr(0, n - 1);
        cleanSet(t, isSuffix);
    }

    // "ab" as a prefix makes "abc" redundant.
    StringSet out;
    for (auto& str : t) {
        if (!out.empty()) {
            const auto& last = out.back();
            if (isSuffix ? str.ends_with(last) : str.starts_with(last)) continue;
        }
        out.push_back(std::move(str));
    }
    s = std::move(out);
}

Info concat(Info x, Info y) {
    Info xy;
    xy.canEmpty = x.canEmpty && y.canEmpty;
    xy.match = andQuery(x.match, y.match);

    if (x.hasExact() && y.hasExact()) {
        xy.exact = crossSets(x.exact, y.exact);
    } else {
        if (x.hasExact()) {
            xy.prefix = crossSets(x.exact, y.prefix);
        } else {
            xy.prefix = x.prefix;
            if (x.canEmpty) xy.prefix = unionSets(std::move(xy.prefix), y.prefix);
        }
        if (y.hasExact()) {
            xy.suffix = crossSets(x.suffix, y.exact, true);
        } else {
            xy.suffix = y.suffix;
            if (y.canEmpty) xy.suffix = unionSets(std::move(xy.suffix), x.suffix, true);
        }
    }

    // A trigram spanning the boundary is required when every suffix of x
    // joined to every prefix of y is long enough.
    if (!x.hasExact() && !y.hasExact() && x.suffix.size() <= MAX_SET && y.prefix.size() <= MAX_SET &&
        minLen(x.suffix) + minLen(y.prefix) >= 3)
        xy.match = andTrigrams(std::move(xy.match), crossSets(x.suffix, y.prefix));

    xy.simplify(false);
    return xy;
}

Info alternate(Info x, Info y) {
    Info xy;
    if (x.hasExact() && y.hasExact()) {
        xy.exact = unionSets(x.exact, y.exact);
    } else if (x.hasExact()) {
        xy.prefix = unionSets(x.exact, y.prefix);
        xy.suffix = unionSets(x.exact, y.suffix, true);
        x.addExact();
    } else if (y.hasExact()) {
        xy.prefix = unionSets(x.prefix, y.exact);
        xy.suffix = unionSets(x.suffix, y.exact, true);
        y.addExact();
    } else {
        xy.prefix = unionSets(x.prefix, y.prefix);
        xy.suffix = unionSets(x.suffix, y.suffix, true);
    }
    xy.canEmpty = x.canEmpty || y.canEmpty;
    xy.match = orQuery(std::move(x.match), std::move(y.match));

    xy.simplify(false);
    return xy;
}

// x+ keeps the prefixes and suffixes of x, but is no longer exact.
Info plus(Info x) {
    if (x.hasExact()) {
        x.prefix = x.exact;
        x.suffix = x.exact;
        cleanSet(x.suffix, true);
        x.exact.clear();
    }
    x.simplify(false);
    return x;
}

Info analyze(const Regexp& re);

Info analyzeClass(const std::vector<RuneRange>& ranges) {
    if (ranges.empty()) return noMatch();

    uint64_t n = 0;
    for (const auto& [lo, hi] : ranges) n += hi - lo;
    if (n > 100) return anyChar();

    Info info;
    for (const auto& [lo, hi] : ranges)
        for (char32_t r = lo; r <= hi; ++r) {
            std::string s;
            appendUtf8(s, r);
            info.exact.push_back(std::move(s));
        }
    info.simplify(false);
    return info;
}

// Case variants of r, or empty when they are unknown.
std::vector<RuneRange> foldOrbit(const char32_t r) {
    const char32_t lower = r >= 'A' && r <= 'Z' ? r + 32 : r;
    if (lower == 'k' || r == 0x212A) return {{'K', 'K'}, {'k', 'k'}, {0x212A, 0x212A}};
    if (lower == 's' || r == 0x17F) return {{'S', 'S'}, {'s', 's'}, {0x17F, 0x17F}};
    if (lower >= 'a' && lower <= 'z') return {{lower - 32, lower - 32}, {lower, lower}};
    if (r < 0x80) return {{r, r}};
    return {};
}

Info analyzeLiteral(const Regexp& re) {
    if (!re.foldCase) {
        Info info;
        info.exact.emplace_back();
        for (const char32_t r : re.runes) appendUtf8(info.exact.front(), r);
        info.simplify(false);
        return info;
    }

    // Case-folded text is a concatenation of one class per rune.
    Info info = emptyString();
    for (const char32_t r : re.runes) {
        const auto orbit = foldOrbit(r);
        info = concat(std::move(info), orbit.empty() ? anyChar() : analyzeClass(orbit));
    }
    return info;
}

template <typename F>
Info fold(F f, const std::vector<std::unique_ptr<Regexp>>& subs, Info zero) {
    if (subs.empty()) return zero;
    Info info = analyze(*subs.front());
    for (size_t i = 1; i < subs.size(); ++i) info = f(std::move(info), analyze(*subs[i]));
    return info;
}

Info analyzeRepeat(const Regexp& re) {
    const Regexp& sub = *re.subs.front();
    const int bound = re.max < 0 ? re.min : re.max;

    if (bound > MAX_UNROLL) return re.min == 0 ? anyMatch() : plus(analyze(sub));
    if (re.max == 0) return emptyString();

    // x{n,m} is n copies of x followed by m-n copies of x?; x{n,} ends in x*.
    const Info one = analyze(sub);
    Info info = emptyString();
    for (int i = 0; i < re.min; ++i) info = concat(std::move(info), one);
    if (re.max < 0) return re.min == 0 ? anyMatch() : concat(std::move(info), anyMatch());
    for (int i = re.min; i < re.max; ++i) info = concat(std::move(info), alternate(one, emptyString()));
    return info;
}

Info analyze(const Regexp& re) {
    switch (re.op) {
        case Op::NoMatch:
            return noMatch();
        case Op::EmptyMatch:
        case Op::BeginLine:
        case Op::EndLine:
        case Op::BeginText:
        case Op::EndText:
        case Op::WordBoundary:
        case Op::NoWordBoundary:
            return emptyString();
        case Op::Literal:
            return analyzeLiteral(re);
        case Op::CharClass:
            return analyzeClass(re.ranges);
        case Op::AnyCharNotNL:
        case Op::AnyChar:
            return anyChar();
        case Op::Capture:
            return analyze(*re.subs.front());
        case Op::Concat:
            return fold(concat, re.subs, emptyString());
        case Op::Alternate:
            return fold(alternate, re.subs, noMatch());
        case Op::Quest:
            return alternate(analyze(*re.subs.front()), emptyString());
        case Op::Star:
            return anyMatch();
        case Op::Plus:
            return plus(analyze(*re.subs.front()));
        case Op::Repeat:
            return analyzeRepeat(re);
    }
    return anyMatch();
}

}

Query regexpQuery(const Regexp& re) {
    Info info = analyze(re);
    info.simplify(true);
    info.addExact();
    return info.match;
}

Query regexpQuery(const std::string_view pattern) {
    const auto re = parse(pattern);
    auto q = regexpQuery(*re);
    if (log::Registry::isInitialized())
        log::Registry::query()->debug("[regexpQuery] {} => {}", pattern, q.toString());
    return q;
}

}
