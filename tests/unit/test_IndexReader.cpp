#include <gtest/gtest.h>
#include "TestFiles.hpp"
#include "index/Format.hpp"
#include "index/IndexReader.hpp"
#include "index/IndexWriter.hpp"
#include "index/errors.hpp"
#include "query/QueryEvaluator.hpp"
#include "query/RegexpAnalyzer.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace cs::index;
using cs::query::QueryEvaluator;
using cs::query::regexpQuery;
using cs::test::TempDir;
using cs::test::readFile;
using cs::test::writeFile;

class IndexReaderTest : public ::testing::Test {
protected:
    TempDir dir;
    std::filesystem::path indexPath = dir / "index";

    // One file "a" holding "abc": a single posting list with one id.
    std::string buildTiny() {
        WriterOptions o;
        o.tmp_dir = dir.path();
        IndexWriter w(indexPath, o);
        w.addPaths({"/src"});
        if (w.addFile("a", "abc")) throw std::runtime_error("unexpected skip");
        w.flush();
        return readFile(indexPath);
    }

    static uint32_t trailerField(const std::string& bytes, const size_t i) {
        const auto* p = reinterpret_cast<const uint8_t*>(bytes.data()) + bytes.size() - format::TRAILER_SIZE + 4 * i;
        return format::readUint32(p);
    }
};

TEST_F(IndexReaderTest, LayoutOfTinyIndex) {
    const auto bytes = buildTiny();
    ASSERT_EQ(bytes.substr(0, format::MAGIC.size()), format::MAGIC);
    EXPECT_EQ(bytes.substr(bytes.size() - format::TRAILER_MAGIC.size()), format::TRAILER_MAGIC);

    const uint32_t paths = trailerField(bytes, 0);
    const uint32_t names = trailerField(bytes, 1);
    const uint32_t postings = trailerField(bytes, 2);
    EXPECT_EQ(paths, format::MAGIC.size());
    EXPECT_EQ(bytes.substr(paths, names - paths), std::string("/src\0\0", 6));
    EXPECT_EQ(bytes.substr(names, postings - names), std::string("a\0\0", 3));
    EXPECT_EQ(bytes.substr(postings, 5), std::string("abc\x01\x00", 5));
}

TEST_F(IndexReaderTest, MissingFileIsAnIoError) {
    EXPECT_THROW(IndexReader{dir / "absent"}, IoError);
}

TEST_F(IndexReaderTest, EmptyFileIsCorrupt) {
    writeFile(indexPath, "");
    EXPECT_THROW(IndexReader{indexPath}, CorruptIndex);
}

TEST_F(IndexReaderTest, BadHeaderIsCorrupt) {
    auto bytes = buildTiny();
    bytes[0] = 'X';
    writeFile(indexPath, bytes);
    EXPECT_THROW(IndexReader{indexPath}, CorruptIndex);
}

TEST_F(IndexReaderTest, TruncatedFileIsCorrupt) {
    const auto bytes = buildTiny();
    writeFile(indexPath, bytes.substr(0, bytes.size() - 1));
    EXPECT_THROW(IndexReader{indexPath}, CorruptIndex);
}

TEST_F(IndexReaderTest, OffsetsOutOfOrderAreCorrupt) {
    auto bytes = buildTiny();
    // names offset pointing before the paths
    const size_t field = bytes.size() - format::TRAILER_SIZE + 4;
    bytes[field] = bytes[field + 1] = bytes[field + 2] = bytes[field + 3] = 0;
    writeFile(indexPath, bytes);
    EXPECT_THROW(IndexReader{indexPath}, CorruptIndex);
}

TEST_F(IndexReaderTest, PostingIdOutOfRangeIsCorrupt) {
    auto bytes = buildTiny();
    const uint32_t postings = trailerField(bytes, 2);
    bytes[postings + 3] = 0x05; // id 4 in an index of one file
    writeFile(indexPath, bytes);

    const IndexReader r(indexPath);
    EXPECT_THROW((void)r.postingList(trigramFromString("abc")).toVector(), CorruptIndex);
}

TEST_F(IndexReaderTest, PostingCountMismatchIsCorrupt) {
    auto bytes = buildTiny();
    const uint32_t postIndex = trailerField(bytes, 4);
    bytes[postIndex + 6] = 0x02; // count 2 for a list holding one id
    writeFile(indexPath, bytes);

    const IndexReader r(indexPath);
    EXPECT_THROW((void)r.postingList(trigramFromString("abc")).toVector(), CorruptIndex);
}

TEST_F(IndexReaderTest, HugePostingCountIsCorrupt) {
    auto bytes = buildTiny();
    const uint32_t postIndex = trailerField(bytes, 4);
    bytes[postIndex + 3] = '\xF0'; // count 0xF0000001 in an index of one file
    writeFile(indexPath, bytes);

    const IndexReader r(indexPath);
    EXPECT_THROW((void)r.trigramEntry(0), CorruptIndex);
    EXPECT_THROW((void)r.postingList(trigramFromString("abc")), CorruptIndex);
    EXPECT_THROW((void)QueryEvaluator(r).candidates(regexpQuery("abc")), CorruptIndex);
}

TEST_F(IndexReaderTest, PostingOffsetMismatchIsCorrupt) {
    auto bytes = buildTiny();
    const uint32_t postIndex = trailerField(bytes, 4);
    bytes[postIndex + 10] = 0x01; // list offset 1 lands inside the trigram bytes
    writeFile(indexPath, bytes);

    const IndexReader r(indexPath);
    EXPECT_THROW((void)r.postingList(trigramFromString("abc")), CorruptIndex);
}

TEST_F(IndexReaderTest, TrigramEntriesAreSorted) {
    WriterOptions o;
    o.tmp_dir = dir.path();
    IndexWriter w(indexPath, o);
    ASSERT_FALSE(w.addFile("x", "zyxwvutsrq"));
    w.flush();

    const IndexReader r(indexPath);
    const auto t = r.trigrams();
    ASSERT_EQ(t.size(), 8u);
    EXPECT_TRUE(std::is_sorted(t.begin(), t.end()));
    EXPECT_EQ(trigramToString(r.trigramEntry(0).trigram), "srq");
    EXPECT_THROW((void)r.trigramEntry(8), NotFound);
}
