#include <gtest/gtest.h>
#include "index/TrigramExtractor.hpp"
#include "query/RegexpAnalyzer.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace cs::query;
using cs::index::TrigramExtractor;
using cs::index::trigramToString;

namespace {

std::string plan(const std::string& pattern) { return regexpQuery(pattern).toString(); }

std::set<std::string> trigramsOf(const std::string& text) {
    cs::index::ExtractorLimits limits;
    limits.max_invalid_utf8_ratio = 1.0;
    TrigramExtractor ex(limits);
    if (ex.extract(text)) throw std::runtime_error("text skipped");
    std::set<std::string> out;
    for (const auto t : ex.trigrams()) out.insert(trigramToString(t));
    return out;
}

// Would a file with these trigrams survive the query?
bool admits(const Query& q, const std::set<std::string>& have) {
    switch (q.op) {
        case QueryOp::All: return true;
        case QueryOp::None: return false;
        case QueryOp::And:
            return std::all_of(q.trigrams.begin(), q.trigrams.end(), [&](const auto& t) { return have.contains(t); }) &&
                   std::all_of(q.subs.begin(), q.subs.end(), [&](const Query& s) { return admits(s, have); });
        case QueryOp::Or:
            return std::any_of(q.trigrams.begin(), q.trigrams.end(), [&](const auto& t) { return have.contains(t); }) ||
                   std::any_of(q.subs.begin(), q.subs.end(), [&](const Query& s) { return admits(s, have); });
    }
    return true;
}

}

TEST(RegexpAnalyzerTest, Literals) {
    EXPECT_EQ(plan("abc"), "\"abc\"");
    EXPECT_EQ(plan("Abcdef"), "\"Abc\" \"bcd\" \"cde\" \"def\"");
    EXPECT_EQ(plan("(abc)(def)"), "\"abc\" \"bcd\" \"cde\" \"def\"");
}

TEST(RegexpAnalyzerTest, ShortLiteralsConstrainNothing) {
    EXPECT_EQ(plan("ab"), "+");
    EXPECT_EQ(plan("a"), "+");
    EXPECT_EQ(plan(""), "+");
    EXPECT_EQ(plan("abc|x"), "+");
}

TEST(RegexpAnalyzerTest, Wildcards) {
    EXPECT_EQ(plan(".*"), "+");
    EXPECT_EQ(plan("a*"), "+");
    EXPECT_EQ(plan("abc.*def"), "\"abc\" \"def\"");
    EXPECT_EQ(plan("a+hello"), "\"ahe\" \"ell\" \"hel\" \"llo\"");
    EXPECT_EQ(plan("a*hello"), "\"ell\" \"hel\" \"llo\"");
}

TEST(RegexpAnalyzerTest, Alternation) {
    EXPECT_EQ(plan("def|abc"), "(\"abc\"|\"def\")");
    EXPECT_EQ(plan("abc(def|ghi)"), "\"abc\" (\"bcd\" \"cde\" \"def\")|(\"bcg\" \"cgh\" \"ghi\")");
}

TEST(RegexpAnalyzerTest, CaseFolding) {
    EXPECT_EQ(plan("(?i)abc"), "(\"ABC\"|\"ABc\"|\"AbC\"|\"Abc\"|\"aBC\"|\"aBc\"|\"abC\"|\"abc\")");
}

TEST(RegexpAnalyzerTest, NoMatchPropagates) {
    EXPECT_EQ(plan("[^\\x00-\\x{10FFFF}]"), "-");
}

TEST(RegexpAnalyzerTest, NoFalseNegatives) {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"hello", "say hello world"},
        {"hel+o", "helllllo"},
        {"a[bc]d[ef]g", "acdfg"},
        {"(foo|bar)baz", "xbarbaz"},
        {"(foo|ba)r?baz", "babaz"},
        {"ab{2,4}c", "abbbbc"},
        {"(ab){3}", "ababab"},
        {"x(ab){0,9}y", "xy"},
        {"x(ab){0,9}y", "xabababababababababy"},
        {"(?i)HeLLo", "hello"},
        {"(?i)kelvin", "\xE2\x84\xAA" "elvin"},
        {"(?i)strasse", "\xC5\xBFtrasse"},
        {"(?i)caf\xC3\xA9", "CAF\xC3\x89"},
        {"\\bword\\b", "a word here"},
        {"^func main", "package x\nfunc main() {}"},
        {"a.c", "a\xC3\xA9" "c"},
        {"[0-9]+px", "width: 100px"},
        {"(?s)begin.*end", "begin\nmiddle\nend"},
        {"int|float|double", "double d;"},
        {"[[:upper:]]{3}", "XYZ"},
        {"\\d\\d\\d-\\d\\d\\d\\d", "555-1234"},
        {"colou?r", "color"},
        {"(a|b)(c|d)(e|f)(g|h)", "bdeh"},
        {"x[^y]z", "x\xE2\x82\xACz"},
        {"\\pLabc", "\xCE\xB1" "abc"},
    };
    for (const auto& [pattern, text] : cases) {
        const Query q = regexpQuery(pattern);
        EXPECT_TRUE(admits(q, trigramsOf(text))) << pattern << " => " << q.toString();
    }
}

TEST(RegexpAnalyzerTest, UsefulQueriesRejectNonMatches) {
    const auto q = regexpQuery("(foo|bar)baz");
    EXPECT_FALSE(admits(q, trigramsOf("nothing relevant")));
    EXPECT_FALSE(admits(regexpQuery("hello"), trigramsOf("help")));
}

TEST(RegexpAnalyzerTest, SyntaxErrorsPropagate) {
    EXPECT_THROW((void)regexpQuery("a(b"), RegexpError);
}
