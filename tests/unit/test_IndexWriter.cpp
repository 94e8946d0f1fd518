#include <gtest/gtest.h>
#include "TestFiles.hpp"
#include "index/IndexReader.hpp"
#include "index/IndexWriter.hpp"
#include "index/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cs::index;
using cs::test::TempDir;
using cs::test::writeFile;

namespace {

std::vector<FileId> postings(const IndexReader& r, const std::string& tri) {
    return r.postingList(trigramFromString(tri)).toVector();
}

}

class IndexWriterTest : public ::testing::Test {
protected:
    TempDir dir;
    std::filesystem::path indexPath = dir / "index";

    WriterOptions options() const {
        WriterOptions o;
        o.tmp_dir = dir.path();
        return o;
    }
};

TEST_F(IndexWriterTest, SharedAndDistinctTrigrams) {
    IndexWriter w(indexPath, options());
    ASSERT_FALSE(w.addFile("a.txt", "hello world"));
    ASSERT_FALSE(w.addFile("b.txt", "goodbye world"));
    w.flush();

    const IndexReader r(indexPath);
    ASSERT_EQ(r.numNames(), 2u);
    const FileId a = *r.fileId("a.txt");
    const FileId b = *r.fileId("b.txt");
    EXPECT_EQ(postings(r, "wor"), (std::vector<FileId>{a, b}));
    EXPECT_EQ(postings(r, "hel"), std::vector<FileId>{a});
    EXPECT_EQ(postings(r, "bye"), std::vector<FileId>{b});
    EXPECT_TRUE(postings(r, "zzz").empty());
}

TEST_F(IndexWriterTest, OversizedFileLeavesNoTrace) {
    auto o = options();
    o.limits.max_file_len = 1'000'000;
    IndexWriter w(indexPath, o);

    ASSERT_FALSE(w.addFile("a.txt", "small file"));
    EXPECT_EQ(w.addFile("big.txt", std::string(10'000'000, 'q')), SkipReason::TooLarge);
    w.flush();
    EXPECT_EQ(w.stats().skippedFor(SkipReason::TooLarge), 1u);
    EXPECT_EQ(w.stats().files, 1u);

    const IndexReader r(indexPath);
    EXPECT_EQ(r.names().toVector(), std::vector<std::string>{"a.txt"});
    EXPECT_FALSE(r.fileId("big.txt"));
    EXPECT_TRUE(postings(r, "qqq").empty());
}

TEST_F(IndexWriterTest, OversizedFileOnDiskIsSkippedBeforeReading) {
    const auto big = dir / "tree/big.txt";
    writeFile(big, std::string(2048, 'x'));
    auto o = options();
    o.limits.max_file_len = 1024;

    IndexWriter w(indexPath, o);
    EXPECT_EQ(w.addFile(big), SkipReason::TooLarge);
    w.flush();
    EXPECT_EQ(IndexReader(indexPath).numNames(), 0u);
}

TEST_F(IndexWriterTest, RoundTripPreservesNamesAndIds) {
    std::vector<std::string> names;
    for (int i = 0; i < 50; ++i) names.push_back("src/file" + std::to_string(1000 + i) + ".cc");

    IndexWriter w(indexPath, options());
    w.addPaths({"/root/b", "/root/a", "/root/b"});
    for (const auto& n : names) ASSERT_FALSE(w.addFile(n, "content of " + n));
    w.flush();

    const IndexReader r(indexPath);
    EXPECT_EQ(r.indexedPaths().toVector(), (std::vector<std::string>{"/root/a", "/root/b"}));
    EXPECT_EQ(r.names().toVector(), names);
    for (FileId id = 0; id < r.numNames(); ++id) {
        EXPECT_EQ(r.name(id), names[id]);
        EXPECT_EQ(r.fileId(r.name(id)), id);
    }
    EXPECT_FALSE(r.fileId("src/missing.cc"));
    EXPECT_THROW((void)r.name(r.numNames()), NotFound);
}

TEST_F(IndexWriterTest, FilesFromDisk) {
    const auto a = dir / "tree/a.go";
    const auto b = dir / "tree/b.go";
    writeFile(a, "package main\n");
    writeFile(b, "func main() {}\n");

    IndexWriter w(indexPath, options());
    ASSERT_FALSE(w.addFile(a));
    ASSERT_FALSE(w.addFile(b));
    w.flush();

    const IndexReader r(indexPath);
    EXPECT_EQ(postings(r, "pac"), std::vector<FileId>{0});
    EXPECT_EQ(postings(r, "mai"), (std::vector<FileId>{0, 1}));
    EXPECT_EQ(r.name(1), b.string());
}

TEST_F(IndexWriterTest, MissingFileIsAnIoError) {
    IndexWriter w(indexPath, options());
    const auto missing = dir / "nope.txt";
    try {
        (void)w.addFile(missing);
        FAIL() << "expected IoError";
    } catch (const IoError& e) {
        EXPECT_EQ(e.path(), missing);
        EXPECT_EQ(e.error(), ENOENT);
    }
    // the writer stays usable
    ASSERT_FALSE(w.addFile("ok.txt", "still fine"));
    w.flush();
    EXPECT_EQ(IndexReader(indexPath).numNames(), 1u);
}

TEST_F(IndexWriterTest, DirectoryIsAnIoError) {
    std::filesystem::create_directories(dir / "sub");
    IndexWriter w(indexPath, options());
    EXPECT_THROW((void)w.addFile(dir / "sub"), IoError);
}

TEST_F(IndexWriterTest, NamesMustBeSorted) {
    IndexWriter w(indexPath, options());
    ASSERT_FALSE(w.addFile("b", "bbbb"));
    EXPECT_THROW((void)w.addFile("a", "aaaa"), UnsortedInput);
    EXPECT_THROW((void)w.addFile("b", "bbbb"), UnsortedInput);
    ASSERT_FALSE(w.addFile("c", "cccc"));
    w.flush();
    EXPECT_EQ(IndexReader(indexPath).names().toVector(), (std::vector<std::string>{"b", "c"}));
}

TEST_F(IndexWriterTest, EmptyOrNulNamesAndPathsAreRejected) {
    IndexWriter w(indexPath, options());
    EXPECT_THROW(w.addPaths({"/src", ""}), std::invalid_argument);
    EXPECT_THROW(w.addPaths({std::string("/s\0rc", 5)}), std::invalid_argument);
    EXPECT_THROW((void)w.addFile("", "abcd"), std::invalid_argument);
    EXPECT_THROW((void)w.addFile(std::string("a\0b", 3), "abcd"), std::invalid_argument);

    w.addPaths({"/src", "/lib"});
    ASSERT_FALSE(w.addFile("/src/a", "abcd"));
    w.flush();

    // a rejected batch adds nothing, so "/src" is stored once
    const IndexReader r(indexPath);
    EXPECT_EQ(r.indexedPaths().toVector(), (std::vector<std::string>{"/lib", "/src"}));
    EXPECT_EQ(r.names().toVector(), std::vector<std::string>{"/src/a"});
}

TEST_F(IndexWriterTest, OutputInMissingDirectoryIsAnIoError) {
    const auto out = dir / "missing/index";
    {
        IndexWriter w(out, options());
        ASSERT_FALSE(w.addFile("a", "abcd"));
        try {
            w.flush();
            FAIL() << "expected IoError";
        } catch (const IoError& e) {
            EXPECT_EQ(e.path(), out);
            EXPECT_EQ(e.error(), ENOENT);
        }
    }
    EXPECT_FALSE(std::filesystem::exists(dir / "missing"));
    EXPECT_TRUE(std::filesystem::is_empty(dir.path()));
}

TEST_F(IndexWriterTest, WriteFailureDuringFlushRemovesOutput) {
    // every write to /dev/full fails with ENOSPC
    ASSERT_TRUE(std::filesystem::exists("/dev/full"));
    std::filesystem::create_symlink("/dev/full", indexPath);
    {
        IndexWriter w(indexPath, options());
        ASSERT_FALSE(w.addFile("a", "hello world"));
        ASSERT_FALSE(w.addFile("b", "goodbye world"));
        try {
            w.flush();
            FAIL() << "expected IoError";
        } catch (const IoError& e) {
            EXPECT_EQ(e.path(), indexPath);
            EXPECT_EQ(e.error(), ENOSPC);
        }
    }
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(indexPath)));
    EXPECT_TRUE(std::filesystem::is_empty(dir.path()));
}

TEST_F(IndexWriterTest, SecondFlushFails) {
    IndexWriter w(indexPath, options());
    ASSERT_FALSE(w.addFile("a", "abcd"));
    w.flush();
    EXPECT_TRUE(w.flushed());
    EXPECT_THROW(w.flush(), AlreadyFlushed);
    EXPECT_THROW((void)w.addFile("b", "abcd"), AlreadyFlushed);
}

TEST_F(IndexWriterTest, EmptyIndex) {
    IndexWriter w(indexPath, options());
    w.flush();

    const IndexReader r(indexPath);
    EXPECT_EQ(r.numNames(), 0u);
    EXPECT_EQ(r.numTrigrams(), 0u);
    EXPECT_TRUE(r.names().empty());
    EXPECT_TRUE(r.indexedPaths().empty());
}

TEST_F(IndexWriterTest, TinySortBufferSpillsManyRuns) {
    auto small = options();
    small.sort_buffer_bytes = 64; // eight pairs per run

    std::mt19937 rng(7);
    std::uniform_int_distribution<int> letter('a', 'h');
    std::vector<std::pair<std::string, std::string>> files;
    for (int i = 0; i < 40; ++i) {
        std::string content;
        for (int j = 0; j < 60; ++j) content += static_cast<char>(letter(rng));
        files.emplace_back("f" + std::to_string(100 + i), content);
    }

    const auto bigPath = dir / "big-buffer";
    IndexWriter spilled(indexPath, small);
    IndexWriter inMemory(bigPath, options());
    for (const auto& [name, content] : files) {
        ASSERT_FALSE(spilled.addFile(name, content));
        ASSERT_FALSE(inMemory.addFile(name, content));
    }
    spilled.flush();
    inMemory.flush();
    EXPECT_GT(spilled.stats().runs, 10u);
    EXPECT_EQ(inMemory.stats().runs, 0u);

    const IndexReader a(indexPath);
    const IndexReader b(bigPath);
    ASSERT_EQ(a.trigrams(), b.trigrams());
    for (size_t i = 0; i < a.numTrigrams(); ++i) {
        const auto ea = a.trigramEntry(i);
        const auto ids = a.postingList(ea).toVector();
        EXPECT_EQ(ids, b.postingList(ea.trigram).toVector());
        EXPECT_EQ(ids.size(), ea.count);
        EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
        EXPECT_EQ(std::set<FileId>(ids.begin(), ids.end()).size(), ids.size());
    }
}

TEST_F(IndexWriterTest, PostingListsMatchExtractedTrigrams) {
    const std::vector<std::pair<std::string, std::string>> files = {
        {"1", "alpha beta"}, {"2", "beta gamma"}, {"3", "gamma delta"}, {"4", "delta alpha"}};

    IndexWriter w(indexPath, options());
    for (const auto& [name, content] : files) ASSERT_FALSE(w.addFile(name, content));
    w.flush();

    const IndexReader r(indexPath);
    TrigramExtractor ex;
    for (FileId id = 0; id < files.size(); ++id) {
        ASSERT_FALSE(ex.extract(files[id].second));
        const std::set<Trigram> own(ex.trigrams().begin(), ex.trigrams().end());
        for (const Trigram t : r.trigrams()) {
            const auto ids = r.postingList(t).toVector();
            const bool listed = std::find(ids.begin(), ids.end(), id) != ids.end();
            EXPECT_EQ(listed, own.contains(t)) << trigramToString(t) << " in file " << id;
        }
    }
}
