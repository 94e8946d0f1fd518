#include <gtest/gtest.h>
#include "index/TrigramExtractor.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace cs::index;

namespace {

std::vector<std::string> trigramStrings(const TrigramExtractor& ex) {
    std::vector<std::string> out;
    for (const Trigram t : ex.trigrams()) out.push_back(trigramToString(t));
    return out;
}

bool hasTrigram(const TrigramExtractor& ex, const std::string& s) {
    const auto& t = ex.trigrams();
    return std::binary_search(t.begin(), t.end(), trigramFromString(s));
}

}

TEST(TrigramExtractorTest, DistinctSortedTrigrams) {
    TrigramExtractor ex;
    ASSERT_FALSE(ex.extract("hello world"));
    EXPECT_EQ(trigramStrings(ex),
              (std::vector<std::string>{" wo", "ell", "hel", "llo", "lo ", "o w", "orl", "rld", "wor"}));
}

TEST(TrigramExtractorTest, RepeatedTrigramsCountOnce) {
    TrigramExtractor ex;
    ASSERT_FALSE(ex.extract("aaaaaaaa"));
    EXPECT_EQ(trigramStrings(ex), std::vector<std::string>{"aaa"});
}

TEST(TrigramExtractorTest, ShortContentHasNoTrigrams) {
    TrigramExtractor ex;
    ASSERT_FALSE(ex.extract("ab"));
    EXPECT_TRUE(ex.trigrams().empty());
    ASSERT_FALSE(ex.extract(""));
    EXPECT_TRUE(ex.trigrams().empty());
}

TEST(TrigramExtractorTest, NewlinesAreOrdinaryBytes) {
    TrigramExtractor ex;
    ASSERT_FALSE(ex.extract("ab\ncd"));
    EXPECT_TRUE(hasTrigram(ex, "ab\n"));
    EXPECT_TRUE(hasTrigram(ex, "b\nc"));
    EXPECT_TRUE(hasTrigram(ex, "\ncd"));
}

TEST(TrigramExtractorTest, ChunkedFeedMatchesWholeContent) {
    const std::string text = "the quick brown fox jumps over the lazy dog\n";
    TrigramExtractor whole;
    ASSERT_FALSE(whole.extract(text));

    TrigramExtractor chunked;
    chunked.reset();
    for (size_t i = 0; i < text.size(); i += 5) {
        const auto n = std::min<size_t>(5, text.size() - i);
        ASSERT_FALSE(chunked.feed({reinterpret_cast<const uint8_t*>(text.data()) + i, n}));
    }
    ASSERT_FALSE(chunked.finish());
    EXPECT_EQ(whole.trigrams(), chunked.trigrams());
}

TEST(TrigramExtractorTest, ExtractionIsRepeatable) {
    TrigramExtractor ex;
    const std::string text = "int main() { return 0; }";
    const auto first = ex.extract(text);
    const auto firstSet = ex.trigrams();
    const auto second = ex.extract(text);
    EXPECT_EQ(first, second);
    EXPECT_EQ(firstSet, ex.trigrams());
}

TEST(TrigramExtractorTest, MultiByteRunesStayWhole) {
    TrigramExtractor ex;
    ASSERT_FALSE(ex.extract("h\xC3\xA9llo"));
    EXPECT_TRUE(hasTrigram(ex, "h\xC3\xA9"));
    EXPECT_TRUE(hasTrigram(ex, "\xC3\xA9l"));
    EXPECT_TRUE(hasTrigram(ex, "llo"));
}

TEST(TrigramExtractorTest, NoTrigramSpansInvalidBytes) {
    ExtractorLimits limits;
    limits.max_invalid_utf8_ratio = 1.0;
    TrigramExtractor ex(limits);
    ASSERT_FALSE(ex.extract("abc\xFF" "def"));
    EXPECT_EQ(trigramStrings(ex), (std::vector<std::string>{"abc", "def"}));
    EXPECT_EQ(ex.invalidBytes(), 1u);
}

TEST(TrigramExtractorTest, TooLargeIsSkipped) {
    ExtractorLimits limits;
    limits.max_file_len = 10;
    TrigramExtractor ex(limits);
    EXPECT_EQ(ex.extract(std::string(11, 'x')), SkipReason::TooLarge);
    EXPECT_FALSE(ex.extract(std::string(10, 'x')));
}

TEST(TrigramExtractorTest, LongLineIsSkipped) {
    ExtractorLimits limits;
    limits.max_line_len = 8;
    TrigramExtractor ex(limits);
    EXPECT_EQ(ex.extract("short\n123456789\n"), SkipReason::LineTooLong);
    EXPECT_FALSE(ex.extract("12345678\n12345678\n"));
}

TEST(TrigramExtractorTest, TooManyTrigramsIsSkipped) {
    ExtractorLimits limits;
    limits.max_trigram_count = 3;
    TrigramExtractor ex(limits);
    EXPECT_EQ(ex.extract("abcdef"), SkipReason::TooManyTrigrams);
    EXPECT_FALSE(ex.extract("abcde"));
}

TEST(TrigramExtractorTest, BinaryContentIsSkipped) {
    TrigramExtractor ex;
    std::string binary;
    for (int i = 0; i < 256; ++i) binary += static_cast<char>(0x80 | (i & 0x3F));
    EXPECT_EQ(ex.extract(binary), SkipReason::InvalidEncoding);
}

TEST(TrigramExtractorTest, SkipDecisionIsSticky) {
    ExtractorLimits limits;
    limits.max_line_len = 4;
    TrigramExtractor ex(limits);
    ex.reset();
    const std::string bad = "123456";
    EXPECT_EQ(ex.feed({reinterpret_cast<const uint8_t*>(bad.data()), bad.size()}), SkipReason::LineTooLong);
    const std::string good = "\nab";
    EXPECT_EQ(ex.feed({reinterpret_cast<const uint8_t*>(good.data()), good.size()}), SkipReason::LineTooLong);
    EXPECT_EQ(ex.finish(), SkipReason::LineTooLong);
}

TEST(TrigramExtractorTest, SkipReasonNames) {
    EXPECT_EQ(to_string(SkipReason::TooLarge), "too large");
    EXPECT_EQ(to_string(SkipReason::InvalidEncoding), "invalid UTF-8");
}
