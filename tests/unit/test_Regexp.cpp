#include <gtest/gtest.h>
#include "query/Regexp.hpp"

#include <string>
#include <vector>

using namespace cs::query;

namespace {

std::string dump(const std::string& pattern) { return parse(pattern)->dump(); }

}

TEST(RegexpParseTest, Literals) {
    EXPECT_EQ(dump("abc"), "lit{abc}");
    EXPECT_EQ(dump(""), "emp{}");
    EXPECT_EQ(dump("a\\.b"), "lit{a.b}");
    EXPECT_EQ(dump("\\x41\\x{263a}"), "lit{A\xE2\x98\xBA}");
    EXPECT_EQ(dump("\\101"), "lit{A}");
    EXPECT_EQ(dump("\\Qa.b*\\E"), "lit{a.b*}");
    EXPECT_EQ(dump("x{"), "lit{x{}");
}

TEST(RegexpParseTest, Concatenation) {
    EXPECT_EQ(dump("a.b"), "cat{lit{a}dnl{}lit{b}}");
    EXPECT_EQ(dump("(?s)a.b"), "cat{lit{a}dot{}lit{b}}");
    EXPECT_EQ(dump("ab*"), "cat{lit{a}star{lit{b}}}");
}

TEST(RegexpParseTest, Repetition) {
    EXPECT_EQ(dump("a*"), "star{lit{a}}");
    EXPECT_EQ(dump("a+"), "plus{lit{a}}");
    EXPECT_EQ(dump("a?"), "que{lit{a}}");
    EXPECT_EQ(dump("a*?"), "nstar{lit{a}}");
    EXPECT_EQ(dump("(?U)a+"), "nplus{lit{a}}");
    EXPECT_EQ(dump("(?U)a+?"), "plus{lit{a}}");
    EXPECT_EQ(dump("a{2,3}"), "rep{2,3 lit{a}}");
    EXPECT_EQ(dump("a{2}"), "rep{2,2 lit{a}}");
    EXPECT_EQ(dump("a{2,}"), "rep{2,-1 lit{a}}");
}

TEST(RegexpParseTest, AlternationAndGroups) {
    EXPECT_EQ(dump("a|b"), "alt{lit{a}lit{b}}");
    EXPECT_EQ(dump("(ab)"), "cap{lit{ab}}");
    EXPECT_EQ(dump("(?:ab)c"), "lit{abc}");
    EXPECT_EQ(dump("(?:ab)*c"), "cat{star{lit{ab}}lit{c}}");
    EXPECT_EQ(dump("(?P<word>x)"), "cap{word:lit{x}}");
    EXPECT_EQ(dump("(?<n1>x|y)"), "cap{n1:alt{lit{x}lit{y}}}");
    EXPECT_EQ(dump("a|"), "alt{lit{a}emp{}}");
}

TEST(RegexpParseTest, Anchors) {
    EXPECT_EQ(dump("^a$"), "cat{bot{}lit{a}eot{}}");
    EXPECT_EQ(dump("(?m)^a$"), "cat{bol{}lit{a}eol{}}");
    EXPECT_EQ(dump("\\ba\\B"), "cat{wb{}lit{a}nwb{}}");
    EXPECT_EQ(dump("\\Aa\\z"), "cat{bot{}lit{a}eot{}}");
}

TEST(RegexpParseTest, CharacterClasses) {
    EXPECT_EQ(dump("[a-c]"), "cc{0x61-0x63}");
    EXPECT_EQ(dump("[ca-b]"), "cc{0x61-0x63}");
    EXPECT_EQ(dump("[^a]"), "cc{0x0-0x60 0x62-0x10ffff}");
    EXPECT_EQ(dump("\\d"), "cc{0x30-0x39}");
    EXPECT_EQ(dump("[[:digit:]x]"), "cc{0x30-0x39 0x78}");
    EXPECT_EQ(dump("[]a]"), "cc{0x5d 0x61}");
    EXPECT_EQ(dump("[a-]"), "cc{0x2d 0x61}");
    EXPECT_EQ(dump("\\pL"), "cc{0x0-0x10ffff}");
}

TEST(RegexpParseTest, CaseFolding) {
    EXPECT_EQ(dump("(?i)ab"), "litfold{ab}");
    EXPECT_EQ(dump("(?i)1a"), "cat{lit{1}litfold{a}}");
    EXPECT_EQ(dump("(?i)[a-c]"), "cc{0x41-0x43 0x61-0x63}");
    EXPECT_EQ(dump("(?i)[k]"), "cc{0x4b 0x6b 0x212a}");
    EXPECT_EQ(dump("(?i:a)b"), "cat{litfold{a}lit{b}}");
    EXPECT_EQ(dump("(?i)a(?-i)b"), "cat{litfold{a}lit{b}}");
    // no case tables for this rune: the class widens to everything
    EXPECT_EQ(dump("(?i)[\xC3\xA9]"), "cc{0x0-0x10ffff}");
}

TEST(RegexpParseTest, BraceWithoutACountIsLiteral) {
    // a count with a leading zero is not a count
    EXPECT_EQ(dump("{03}"), "lit{{03}}");
    EXPECT_EQ(dump("a{03}"), "lit{a{03}}");
    EXPECT_EQ(dump("a{1,02}"), "lit{a{1,02}}");
    EXPECT_EQ(dump("a{,2}"), "lit{a{,2}}");
    EXPECT_EQ(dump("{+{01}"), "cat{plus{lit{{}}lit{{01}}}");
    EXPECT_EQ(dump("a{0}"), "rep{0,0 lit{a}}");
    EXPECT_EQ(dump("a{10}"), "rep{10,10 lit{a}}");
}

TEST(RegexpParseTest, EmptyFlagGroupIsIgnored) {
    EXPECT_EQ(dump("(?)"), "emp{}");
    EXPECT_EQ(dump("(?)a"), "lit{a}");
    EXPECT_EQ(dump("a(?)b"), "lit{ab}");
}

TEST(RegexpParseTest, SyntaxErrors) {
    const std::vector<std::string> bad = {
        "a**", "(abc", "abc)", "[a", "*a", "a\\", "a{2,1}", "a{1001}", "(?i-)", "(?-)", "[z-a]", "\\8", "(?P<>x)", "+",
        "{2}", "a+{2}", "x{2}{3}",
    };
    for (const auto& p : bad) EXPECT_THROW((void)parse(p), RegexpError) << p;
}

TEST(RegexpParseTest, ErrorCarriesPosition) {
    try {
        (void)parse("ab(cd");
        FAIL() << "expected RegexpError";
    } catch (const RegexpError& e) {
        EXPECT_EQ(e.position(), 2u);
        EXPECT_NE(std::string(e.what()).find("missing closing )"), std::string::npos);
    }
}
