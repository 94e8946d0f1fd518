#include "query/Regexp.hpp"

#include <algorithm>
#include <cstdint>
#include <fmt/format.h>

namespace cs::query {

namespace {

constexpr int MAX_REPEAT = 1000;

enum Flags : unsigned {
    FOLD_CASE = 1u << 0,  // i
    MULTI_LINE = 1u << 1, // m
    DOT_NL = 1u << 2,     // s
    NON_GREEDY = 1u << 3  // U
};

bool isAsciiAlnum(const char32_t c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isOctal(const char c) { return c >= '0' && c <= '7'; }

int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Runes whose case variants the planner knows how to enumerate.
bool hasKnownFold(const char32_t r) {
    return r < 0x80 || r == 0x17F || r == 0x212A;
}

bool needsFold(const char32_t r) {
    return (r >= 'a' && r <= 'z') || (r >= 'A' && r <= 'Z') || r >= 0x80;
}

void cleanRanges(std::vector<RuneRange>& ranges) {
    std::sort(ranges.begin(), ranges.end());
    std::vector<RuneRange> out;
    for (const auto& r : ranges) {
        if (!out.empty() && r.first <= out.back().second + 1) out.back().second = std::max(out.back().second, r.second);
        else out.push_back(r);
    }
    ranges = std::move(out);
}

std::vector<RuneRange> negateRanges(const std::vector<RuneRange>& ranges) {
    std::vector<RuneRange> out;
    char32_t next = 0;
    for (const auto& [lo, hi] : ranges) {
        if (lo > next) out.emplace_back(next, lo - 1);
        next = hi + 1;
    }
    if (next <= MAX_RUNE) out.emplace_back(next, MAX_RUNE);
    return out;
}

bool containsRune(const std::vector<RuneRange>& ranges, const char32_t r) {
    return std::any_of(ranges.begin(), ranges.end(), [r](const RuneRange& x) { return x.first <= r && r <= x.second; });
}

// Adds the case variants of every rune in the class. Returns false when the
// class holds runes whose variants are unknown.
bool foldRanges(std::vector<RuneRange>& ranges) {
    std::vector<RuneRange> extra;
    auto shifted = [&](const RuneRange& r, const char32_t a, const char32_t b, const int delta) {
        const char32_t lo = std::max(r.first, a), hi = std::min(r.second, b);
        if (lo <= hi) extra.emplace_back(lo + delta, hi + delta);
    };

    for (const auto& r : ranges) {
        shifted(r, 'a', 'z', -32);
        shifted(r, 'A', 'Z', 32);
        if (r.second >= 0x80) {
            const char32_t lo = std::max<char32_t>(r.first, 0x80);
            if (lo != r.second || !hasKnownFold(lo)) return false;
        }
    }
    ranges.insert(ranges.end(), extra.begin(), extra.end());

    if (containsRune(ranges, 'k') || containsRune(ranges, 0x212A)) {
        ranges.emplace_back('k', 'k');
        ranges.emplace_back('K', 'K');
        ranges.emplace_back(0x212A, 0x212A);
    }
    if (containsRune(ranges, 's') || containsRune(ranges, 0x17F)) {
        ranges.emplace_back('s', 's');
        ranges.emplace_back('S', 'S');
        ranges.emplace_back(0x17F, 0x17F);
    }
    cleanRanges(ranges);
    return true;
}

struct PosixClass {
    std::string_view name;
    std::vector<RuneRange> ranges;
};

const std::vector<PosixClass>& posixClasses() {
    static const std::vector<PosixClass> classes = {
        {"alnum", {{'0', '9'}, {'A', 'Z'}, {'a', 'z'}}},
        {"alpha", {{'A', 'Z'}, {'a', 'z'}}},
        {"ascii", {{0, 0x7F}}},
        {"blank", {{'\t', '\t'}, {' ', ' '}}},
        {"cntrl", {{0, 0x1F}, {0x7F, 0x7F}}},
        {"digit", {{'0', '9'}}},
        {"graph", {{'!', '~'}}},
        {"lower", {{'a', 'z'}}},
        {"print", {{' ', '~'}}},
        {"punct", {{'!', '/'}, {':', '@'}, {'[', '`'}, {'{', '~'}}},
        {"space", {{'\t', '\r'}, {' ', ' '}}},
        {"upper", {{'A', 'Z'}}},
        {"word", {{'0', '9'}, {'A', 'Z'}, {'_', '_'}, {'a', 'z'}}},
        {"xdigit", {{'0', '9'}, {'A', 'F'}, {'a', 'f'}}},
    };
    return classes;
}

// \d \s \w and their negations; empty when c is not a Perl class letter.
std::vector<RuneRange> perlClass(const char c) {
    std::vector<RuneRange> r;
    switch (c) {
        case 'd': case 'D': r = {{'0', '9'}}; break;
        case 's': case 'S': r = {{'\t', '\n'}, {'\f', '\r'}, {' ', ' '}}; break;
        case 'w': case 'W': r = {{'0', '9'}, {'A', 'Z'}, {'_', '_'}, {'a', 'z'}}; break;
        default: return r;
    }
    if (c >= 'A' && c <= 'Z') r = negateRanges(r);
    return r;
}

class Parser {
public:
    explicit Parser(const std::string_view pattern) : pat_(pattern) {}

    std::unique_ptr<Regexp> run() {
        auto re = parseAlternate();
        if (more()) throw error("unexpected )", pos_);
        return re;
    }

private:
    [[nodiscard]] bool more() const { return pos_ < pat_.size(); }
    [[nodiscard]] char peek() const { return pat_[pos_]; }
    [[nodiscard]] bool lookingAt(const std::string_view s) const { return pat_.substr(pos_).starts_with(s); }

    [[nodiscard]] RegexpError error(const std::string& msg, const size_t at) const {
        return {msg, pat_, at};
    }

    static std::unique_ptr<Regexp> make(const Op op) { return std::make_unique<Regexp>(op); }

    char32_t nextRune() {
        const size_t start = pos_;
        const auto b0 = static_cast<uint8_t>(pat_[pos_++]);
        if (b0 < 0x80) return b0;

        unsigned need;
        char32_t r;
        char32_t min;
        if (b0 >= 0xC2 && b0 <= 0xDF) { need = 1; r = b0 & 0x1F; min = 0x80; }
        else if (b0 >= 0xE0 && b0 <= 0xEF) { need = 2; r = b0 & 0x0F; min = 0x800; }
        else if (b0 >= 0xF0 && b0 <= 0xF4) { need = 3; r = b0 & 0x07; min = 0x10000; }
        else throw error("invalid UTF-8", start);

        for (unsigned i = 0; i < need; ++i) {
            if (!more()) throw error("invalid UTF-8", start);
            const auto b = static_cast<uint8_t>(pat_[pos_++]);
            if ((b & 0xC0) != 0x80) throw error("invalid UTF-8", start);
            r = r << 6 | (b & 0x3F);
        }
        if (r < min || r > MAX_RUNE || (r >= 0xD800 && r <= 0xDFFF)) throw error("invalid UTF-8", start);
        return r;
    }

    std::unique_ptr<Regexp> literal(const char32_t r) const {
        auto re = make(Op::Literal);
        re->runes.push_back(r);
        re->foldCase = (flags_ & FOLD_CASE) && needsFold(r);
        return re;
    }

    std::unique_ptr<Regexp> charClass(std::vector<RuneRange> ranges, const bool negate, bool widen) const {
        if (!widen && (flags_ & FOLD_CASE)) widen = !foldRanges(ranges);
        auto re = make(Op::CharClass);
        if (widen) {
            re->ranges = {{0, MAX_RUNE}};
            return re;
        }
        cleanRanges(ranges);
        re->ranges = negate ? negateRanges(ranges) : std::move(ranges);
        return re;
    }

    std::unique_ptr<Regexp> parseAlternate() {
        std::vector<std::unique_ptr<Regexp>> alts;
        alts.push_back(parseConcat());
        while (more() && peek() == '|') {
            ++pos_;
            alts.push_back(parseConcat());
        }
        if (alts.size() == 1) return std::move(alts.front());

        auto re = make(Op::Alternate);
        re->subs = std::move(alts);
        return re;
    }

    std::unique_ptr<Regexp> parseConcat() {
        std::vector<std::unique_ptr<Regexp>> items;
        while (more() && peek() != '|' && peek() != ')') {
            if (lookingAt("\\Q")) {
                pos_ += 2;
                std::vector<std::unique_ptr<Regexp>> quoted;
                while (more() && !lookingAt("\\E")) quoted.push_back(literal(nextRune()));
                if (more()) pos_ += 2;
                if (quoted.empty()) continue;
                auto last = std::move(quoted.back());
                quoted.pop_back();
                for (auto& q : quoted) items.push_back(std::move(q));
                items.push_back(parseQuantifiers(std::move(last)));
                continue;
            }

            auto atom = parseAtom();
            if (!atom) {
                if (more() && isRepeatOp()) throw error("missing argument to repetition operator", pos_);
                continue;
            }
            items.push_back(parseQuantifiers(std::move(atom)));
        }

        // Adjacent runes with the same case handling become one literal.
        std::vector<std::unique_ptr<Regexp>> merged;
        for (auto& item : items) {
            if (!merged.empty() && item->op == Op::Literal && merged.back()->op == Op::Literal &&
                merged.back()->foldCase == item->foldCase) {
                merged.back()->runes += item->runes;
                continue;
            }
            merged.push_back(std::move(item));
        }

        if (merged.empty()) return make(Op::EmptyMatch);
        if (merged.size() == 1) return std::move(merged.front());

        auto re = make(Op::Concat);
        re->subs = std::move(merged);
        return re;
    }

    bool isRepeatOp() {
        const char c = peek();
        if (c == '*' || c == '+' || c == '?') return true;
        if (c != '{') return false;
        size_t p = pos_;
        int lo, hi;
        return parseRepeat(p, lo, hi);
    }

    // {n}, {n,} or {n,m} at p; false when the text is not a repeat, in which
    // case '{' is an ordinary literal.
    bool parseRepeat(size_t& p, int& lo, int& hi) const {
        const size_t start = p;
        if (p >= pat_.size() || pat_[p] != '{') return false;
        ++p;

        // Leading zeros make the text a literal, not a count.
        auto number = [&](int& out) {
            const size_t s = p;
            if (p + 1 < pat_.size() && pat_[p] == '0' && pat_[p + 1] >= '0' && pat_[p + 1] <= '9') return false;
            long v = 0;
            while (p < pat_.size() && pat_[p] >= '0' && pat_[p] <= '9') {
                if (v <= MAX_REPEAT) v = v * 10 + (pat_[p] - '0');
                ++p;
            }
            out = static_cast<int>(std::min<long>(v, MAX_REPEAT + 1));
            return p > s;
        };

        if (!number(lo)) return false;
        hi = lo;
        if (p < pat_.size() && pat_[p] == ',') {
            ++p;
            if (p < pat_.size() && pat_[p] == '}') hi = -1;
            else if (!number(hi)) return false;
        }
        if (p >= pat_.size() || pat_[p] != '}') return false;
        ++p;

        if (lo > MAX_REPEAT || hi > MAX_REPEAT || (hi >= 0 && hi < lo))
            throw error("invalid repeat count " + std::string(pat_.substr(start, p - start)), start);
        return true;
    }

    std::unique_ptr<Regexp> parseQuantifiers(std::unique_ptr<Regexp> atom) {
        if (!more()) return atom;

        const size_t start = pos_;
        Op op;
        int lo = 0, hi = 0;
        switch (peek()) {
            case '*': op = Op::Star; ++pos_; break;
            case '+': op = Op::Plus; ++pos_; break;
            case '?': op = Op::Quest; ++pos_; break;
            case '{': {
                size_t p = pos_;
                if (!parseRepeat(p, lo, hi)) return atom;
                op = Op::Repeat;
                pos_ = p;
                break;
            }
            default: return atom;
        }

        bool lazy = false;
        if (more() && peek() == '?') {
            lazy = true;
            ++pos_;
        }

        auto re = make(op);
        re->min = lo;
        re->max = hi;
        re->nonGreedy = lazy != static_cast<bool>(flags_ & NON_GREEDY);
        re->subs.push_back(std::move(atom));

        if (more() && isRepeatOp())
            throw error("invalid nested repetition operator " + std::string(pat_.substr(start, pos_ - start + 1)),
                        start);
        return re;
    }

    // nullptr for a flag group such as (?i), which matches nothing itself.
    std::unique_ptr<Regexp> parseAtom() {
        const size_t start = pos_;
        switch (peek()) {
            case '(': return parseGroup();
            case '[': return parseClass();
            case '.':
                ++pos_;
                return make(flags_ & DOT_NL ? Op::AnyChar : Op::AnyCharNotNL);
            case '^':
                ++pos_;
                return make(flags_ & MULTI_LINE ? Op::BeginLine : Op::BeginText);
            case '$':
                ++pos_;
                return make(flags_ & MULTI_LINE ? Op::EndLine : Op::EndText);
            case '\\': return parseEscapeAtom();
            case '*':
            case '+':
            case '?':
                throw error("missing argument to repetition operator", start);
            case '{': {
                size_t p = pos_;
                int lo, hi;
                if (parseRepeat(p, lo, hi)) throw error("missing argument to repetition operator", start);
                break;
            }
            default: break;
        }
        return literal(nextRune());
    }

    std::unique_ptr<Regexp> parseGroup() {
        const size_t start = pos_++;
        std::string name;
        bool capture = true;

        if (more() && peek() == '?') {
            ++pos_;
            if (lookingAt("P<") || (lookingAt("<") && !lookingAt("<=") && !lookingAt("<!"))) {
                pos_ += peek() == 'P' ? 2 : 1;
                const size_t end = pat_.find('>', pos_);
                if (end == std::string_view::npos) throw error("invalid named capture", start);
                name = std::string(pat_.substr(pos_, end - pos_));
                if (name.empty() || !std::all_of(name.begin(), name.end(),
                                                 [](const char c) { return isAsciiAlnum(c) || c == '_'; }))
                    throw error("invalid named capture", start);
                pos_ = end + 1;
            } else {
                unsigned flags = flags_;
                bool negate = false, sawFlag = false;
                for (;;) {
                    if (!more()) throw error("missing closing )", start);
                    const char c = pat_[pos_++];
                    unsigned bit = 0;
                    switch (c) {
                        case 'i': bit = FOLD_CASE; break;
                        case 'm': bit = MULTI_LINE; break;
                        case 's': bit = DOT_NL; break;
                        case 'U': bit = NON_GREEDY; break;
                        case '-':
                            if (negate) throw error("invalid or unsupported Perl syntax", start);
                            negate = true;
                            sawFlag = false;
                            continue;
                        case ')':
                        case ':':
                            if (negate && !sawFlag) throw error("invalid or unsupported Perl syntax", start);
                            if (c == ')') {
                                flags_ = flags;
                                return nullptr;
                            }
                            capture = false;
                            break;
                        default:
                            throw error("invalid or unsupported Perl syntax", start);
                    }
                    if (!capture) break;
                    sawFlag = true;
                    flags = negate ? flags & ~bit : flags | bit;
                }
                const unsigned saved = flags_;
                flags_ = flags;
                auto sub = parseAlternate();
                if (!more() || peek() != ')') throw error("missing closing )", start);
                ++pos_;
                flags_ = saved;
                return sub;
            }
        }

        const unsigned saved = flags_;
        const int cap = ++ncap_;
        auto sub = parseAlternate();
        if (!more() || peek() != ')') throw error("missing closing )", start);
        ++pos_;
        flags_ = saved;

        auto re = make(Op::Capture);
        re->cap = cap;
        re->name = std::move(name);
        re->subs.push_back(std::move(sub));
        return re;
    }

    // \pN, \p{Greek}, \PN: Unicode tables are not carried, so any rune.
    void skipUnicodeClassName(const size_t start) {
        if (!more()) throw error("invalid character class range", start);
        if (peek() == '{') {
            const size_t end = pat_.find('}', pos_);
            if (end == std::string_view::npos || end == pos_ + 1) throw error("invalid character class range", start);
            pos_ = end + 1;
        } else {
            nextRune();
        }
    }

    std::unique_ptr<Regexp> parseEscapeAtom() {
        const size_t start = pos_;
        if (pos_ + 1 >= pat_.size()) throw error("trailing backslash at end of expression", start);

        const char c = pat_[pos_ + 1];
        switch (c) {
            case 'A': pos_ += 2; return make(Op::BeginText);
            case 'z': pos_ += 2; return make(Op::EndText);
            case 'b': pos_ += 2; return make(Op::WordBoundary);
            case 'B': pos_ += 2; return make(Op::NoWordBoundary);
            case 'p':
            case 'P':
                pos_ += 2;
                skipUnicodeClassName(start);
                return charClass({}, false, true);
            default: break;
        }

        if (auto ranges = perlClass(c); !ranges.empty()) {
            pos_ += 2;
            return charClass(std::move(ranges), false, false);
        }
        return literal(parseEscapeRune());
    }

    char32_t parseEscapeRune() {
        const size_t start = pos_++;
        if (!more()) throw error("trailing backslash at end of expression", start);

        const char c = pat_[pos_];
        if (c >= '1' && c <= '7' && (pos_ + 1 >= pat_.size() || !isOctal(pat_[pos_ + 1])))
            throw error("invalid escape sequence", start);

        if (isOctal(c)) {
            char32_t r = 0;
            for (int i = 0; i < 3 && more() && isOctal(peek()); ++i) r = r * 8 + (pat_[pos_++] - '0');
            return r;
        }

        ++pos_;
        switch (c) {
            case 'a': return 7;
            case 'f': return '\f';
            case 'n': return '\n';
            case 'r': return '\r';
            case 't': return '\t';
            case 'v': return '\v';
            case 'x': {
                if (more() && peek() == '{') {
                    ++pos_;
                    char32_t r = 0;
                    size_t digits = 0;
                    while (more() && hexValue(peek()) >= 0) {
                        r = r * 16 + hexValue(pat_[pos_++]);
                        if (r > MAX_RUNE) throw error("invalid escape sequence", start);
                        ++digits;
                    }
                    if (!digits || !more() || peek() != '}') throw error("invalid escape sequence", start);
                    ++pos_;
                    return r;
                }
                if (pos_ + 2 > pat_.size() || hexValue(pat_[pos_]) < 0 || hexValue(pat_[pos_ + 1]) < 0)
                    throw error("invalid escape sequence", start);
                const char32_t r = hexValue(pat_[pos_]) * 16 + hexValue(pat_[pos_ + 1]);
                pos_ += 2;
                return r;
            }
            default: break;
        }

        const auto u = static_cast<unsigned char>(c);
        if (u < 0x80 && !isAsciiAlnum(u)) return u;
        throw error("invalid escape sequence", start);
    }

    // [:name:] or [:^name:] at pos_; false when the text is not one.
    bool parsePosixClass(std::vector<RuneRange>& ranges) {
        const size_t end = pat_.find(":]", pos_ + 2);
        if (end == std::string_view::npos) return false;

        std::string_view name = pat_.substr(pos_ + 2, end - pos_ - 2);
        const bool negate = name.starts_with('^');
        if (negate) name.remove_prefix(1);

        const auto& classes = posixClasses();
        const auto it = std::find_if(classes.begin(), classes.end(), [&](const PosixClass& p) { return p.name == name; });
        if (it == classes.end()) throw error("invalid character class range", pos_);

        const auto add = negate ? negateRanges(it->ranges) : it->ranges;
        ranges.insert(ranges.end(), add.begin(), add.end());
        pos_ = end + 2;
        return true;
    }

    std::unique_ptr<Regexp> parseClass() {
        const size_t start = pos_++;
        bool negate = false;
        if (more() && peek() == '^') {
            negate = true;
            ++pos_;
        }

        std::vector<RuneRange> ranges;
        bool widen = false;
        bool first = true;
        for (;; first = false) {
            if (!more()) throw error("missing closing ]", start);
            if (peek() == ']' && !first) {
                ++pos_;
                break;
            }
            if (lookingAt("[:") && parsePosixClass(ranges)) continue;

            const size_t rangeStart = pos_;
            char32_t lo;
            if (peek() == '\\') {
                if (pos_ + 1 < pat_.size()) {
                    const char c = pat_[pos_ + 1];
                    if (auto perl = perlClass(c); !perl.empty()) {
                        ranges.insert(ranges.end(), perl.begin(), perl.end());
                        pos_ += 2;
                        continue;
                    }
                    if (c == 'p' || c == 'P') {
                        pos_ += 2;
                        skipUnicodeClassName(rangeStart);
                        widen = true;
                        continue;
                    }
                }
                lo = parseEscapeRune();
            } else {
                lo = nextRune();
            }

            char32_t hi = lo;
            if (pos_ + 1 < pat_.size() && peek() == '-' && pat_[pos_ + 1] != ']') {
                ++pos_;
                hi = peek() == '\\' ? parseEscapeRune() : nextRune();
                if (hi < lo)
                    throw error("invalid character class range " +
                                std::string(pat_.substr(rangeStart, pos_ - rangeStart)), rangeStart);
            }
            ranges.emplace_back(lo, hi);
        }

        return charClass(std::move(ranges), negate, widen);
    }

    std::string_view pat_;
    size_t pos_ = 0;
    unsigned flags_ = 0;
    int ncap_ = 0;
};

const char* opName(const Op op) {
    switch (op) {
        case Op::NoMatch: return "no";
        case Op::EmptyMatch: return "emp";
        case Op::Literal: return "lit";
        case Op::CharClass: return "cc";
        case Op::AnyCharNotNL: return "dnl";
        case Op::AnyChar: return "dot";
        case Op::BeginLine: return "bol";
        case Op::EndLine: return "eol";
        case Op::BeginText: return "bot";
        case Op::EndText: return "eot";
        case Op::WordBoundary: return "wb";
        case Op::NoWordBoundary: return "nwb";
        case Op::Capture: return "cap";
        case Op::Star: return "star";
        case Op::Plus: return "plus";
        case Op::Quest: return "que";
        case Op::Repeat: return "rep";
        case Op::Concat: return "cat";
        case Op::Alternate: return "alt";
    }
    return "?";
}

void dumpTo(const Regexp& re, std::string& out) {
    if (re.nonGreedy) out += 'n';
    out += opName(re.op);
    if (re.op == Op::Literal && re.foldCase) out += "fold";
    out += '{';
    switch (re.op) {
        case Op::Literal:
            for (const char32_t r : re.runes) appendUtf8(out, r);
            break;
        case Op::CharClass:
            for (size_t i = 0; i < re.ranges.size(); ++i) {
                if (i) out += ' ';
                const auto& [lo, hi] = re.ranges[i];
                out += fmt::format("{:#x}", static_cast<uint32_t>(lo));
                if (hi != lo) out += fmt::format("-{:#x}", static_cast<uint32_t>(hi));
            }
            break;
        case Op::Repeat:
            out += fmt::format("{},{} ", re.min, re.max);
            break;
        case Op::Capture:
            if (!re.name.empty()) out += re.name + ":";
            break;
        default: break;
    }
    for (const auto& sub : re.subs) dumpTo(*sub, out);
    out += '}';
}

}

void appendUtf8(std::string& out, const char32_t r) {
    if (r < 0x80) {
        out += static_cast<char>(r);
    } else if (r < 0x800) {
        out += static_cast<char>(0xC0 | r >> 6);
        out += static_cast<char>(0x80 | (r & 0x3F));
    } else if (r < 0x10000) {
        out += static_cast<char>(0xE0 | r >> 12);
        out += static_cast<char>(0x80 | (r >> 6 & 0x3F));
        out += static_cast<char>(0x80 | (r & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | r >> 18);
        out += static_cast<char>(0x80 | (r >> 12 & 0x3F));
        out += static_cast<char>(0x80 | (r >> 6 & 0x3F));
        out += static_cast<char>(0x80 | (r & 0x3F));
    }
}

std::string Regexp::dump() const {
    std::string out;
    dumpTo(*this, out);
    return out;
}

std::unique_ptr<Regexp> parse(const std::string_view pattern) {
    return Parser(pattern).run();
}

}
