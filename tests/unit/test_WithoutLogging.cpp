#include <gtest/gtest.h>
#include "TestFiles.hpp"
#include "fs/DirWalker.hpp"
#include "index/IndexMerger.hpp"
#include "index/IndexReader.hpp"
#include "index/Indexer.hpp"
#include "log/Registry.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

// Runs under the stock gtest main: the logger registry is never initialized,
// and every library path that would log must still work.

using namespace cs::index;
using cs::test::TempDir;
using cs::test::writeFile;

class WithoutLoggingTest : public ::testing::Test {
protected:
    TempDir dir;

    void SetUp() override {
        ASSERT_FALSE(cs::log::Registry::isInitialized());

        writeFile(dir / "src/main.c", "int main(void) { return 0; }\n");
        writeFile(dir / "src/big.txt", std::string(500, 'x'));
        writeFile(dir / "src/.git/HEAD", "ref: refs/heads/main\n");
        std::filesystem::create_symlink(dir / "src/gone", dir / "src/dangling");
        std::filesystem::create_symlink(dir / "src", dir / "src/loop");
        std::filesystem::create_symlink("/proc/self/mem", dir / "src/mem");
    }

    IndexerOptions options() const {
        IndexerOptions o;
        o.writer.tmp_dir = dir.path();
        o.writer.limits.max_file_len = 100;
        o.writer.sort_buffer_bytes = 16;
        o.channel_capacity = 1;
        o.log_skipped = true;
        return o;
    }

    std::string abs(const std::string& rel) const { return (dir / rel).string(); }
};

TEST_F(WithoutLoggingTest, BuildSkipsFailuresAndMergesQuietly) {
    const auto first = dir / "first";
    Indexer indexer(first, options(), cs::fs::ExcludeList({".git"}));
    ASSERT_TRUE(indexer.build({abs("missing"), abs("src")}));

    const auto& st = indexer.stats();
    EXPECT_EQ(st.errors, 1u);
    EXPECT_EQ(st.writer.skippedFor(SkipReason::TooLarge), 1u);
    EXPECT_GT(st.writer.runs, 1u);
    EXPECT_EQ(st.walk.excluded, 1u);
    EXPECT_EQ(IndexReader(first).names().toVector(), std::vector<std::string>{abs("src/main.c")});

    writeFile(dir / "src/main.c", "int main(void) { return 1; }\n");
    const auto second = dir / "second";
    ASSERT_TRUE(Indexer(second, options(), cs::fs::ExcludeList({".git"})).build({abs("src")}));

    const auto merged = dir / "merged";
    const auto ms = merge(merged, first, second, MergeMode::Supersede, dir.path());
    EXPECT_EQ(ms.dropped, 1u);
    EXPECT_EQ(ms.files, 1u);
    EXPECT_EQ(IndexReader(merged).postingList(trigramFromString("n 1")).toVector(), std::vector<FileId>{0});
}

TEST_F(WithoutLoggingTest, InterruptedBuild) {
    const auto out = dir / "index";
    auto flag = std::make_shared<std::atomic<bool>>(true);
    Indexer indexer(out, options(), {}, flag);
    EXPECT_FALSE(indexer.build({abs("src")}));
    EXPECT_FALSE(std::filesystem::exists(out));
}
