#include <gtest/gtest.h>
#include "index/stats.hpp"

#include <nlohmann/json.hpp>

using namespace cs::index;

TEST(StatsJsonTest, WriterStats) {
    WriterStats s;
    s.files = 3;
    s.skipped[static_cast<size_t>(SkipReason::LineTooLong)] = 2;
    s.trigrams = 40;

    const nlohmann::json j = s;
    EXPECT_EQ(j.at("files").get<uint32_t>(), 3u);
    EXPECT_EQ(j.at("trigrams").get<uint32_t>(), 40u);
    EXPECT_EQ(j.at("skipped").at("line too long").get<uint32_t>(), 2u);
    EXPECT_EQ(j.at("skipped").at("invalid UTF-8").get<uint32_t>(), 0u);
    EXPECT_EQ(j.at("skipped").size(), 4u);
}

TEST(StatsJsonTest, IndexerStatsNestWriterAndWalk) {
    IndexerStats s;
    s.duplicates = 1;
    s.writer.files = 7;
    s.walk.excluded = 5;

    const nlohmann::json j = s;
    EXPECT_EQ(j.at("duplicates").get<uint64_t>(), 1u);
    EXPECT_EQ(j.at("writer").at("files").get<uint32_t>(), 7u);
    EXPECT_EQ(j.at("walk").at("excluded").get<uint64_t>(), 5u);
}

TEST(StatsJsonTest, MergeStats) {
    MergeStats s;
    s.files1 = 10;
    s.files2 = 4;
    s.dropped = 3;
    s.files = 11;

    const nlohmann::json j = s;
    EXPECT_EQ(j.at("files_old").get<uint32_t>(), 10u);
    EXPECT_EQ(j.at("files_new").get<uint32_t>(), 4u);
    EXPECT_EQ(j.at("dropped").get<uint32_t>(), 3u);
    EXPECT_EQ(j.at("files").get<uint32_t>(), 11u);
}
