#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cs::query {

class RegexpError : public std::runtime_error {
public:
    RegexpError(const std::string& msg, std::string_view pattern, size_t pos)
        : std::runtime_error("error parsing regexp: " + msg + " at offset " + std::to_string(pos) + " in `" +
                             std::string(pattern) + "`"),
          pos_(pos) {}

    [[nodiscard]] size_t position() const { return pos_; }

private:
    size_t pos_;
};

constexpr char32_t MAX_RUNE = 0x10FFFF;

enum class Op {
    NoMatch,
    EmptyMatch,
    Literal,
    CharClass,
    AnyCharNotNL,
    AnyChar,
    BeginLine,
    EndLine,
    BeginText,
    EndText,
    WordBoundary,
    NoWordBoundary,
    Capture,
    Star,
    Plus,
    Quest,
    Repeat,
    Concat,
    Alternate
};

using RuneRange = std::pair<char32_t, char32_t>;

// Parsed regular expression. The tree only feeds query planning; exact
// matching is left to RE2. Case-insensitive classes containing runes the
// folder does not know are widened to every rune, which the planner treats
// as "any character".
struct Regexp {
    Op op = Op::EmptyMatch;
    bool foldCase = false;  // Literal
    bool nonGreedy = false; // Star, Plus, Quest, Repeat

    std::u32string runes;           // Literal
    std::vector<RuneRange> ranges;  // CharClass, sorted and non-overlapping
    std::vector<std::unique_ptr<Regexp>> subs;

    int min = 0; // Repeat
    int max = 0; // Repeat, -1 for no upper bound

    int cap = 0; // Capture
    std::string name;

    explicit Regexp(Op o) : op(o) {}

    // Compact structural dump, e.g. cat{lit{ab}star{cc{0x30-0x39}}}.
    [[nodiscard]] std::string dump() const;
};

// Parses RE2 syntax: literals and escapes, ., classes (ranges, negation,
// \d \s \w, [:alpha:]), anchors, captures, non-capturing and named groups,
// flags i m s U, * + ? {n,m} with lazy variants, alternation.
std::unique_ptr<Regexp> parse(std::string_view pattern);

void appendUtf8(std::string& out, char32_t r);

}
