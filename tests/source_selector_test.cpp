#include <gtest/gtest.h>

#include "core/source_selector/source_selector.hpp"

namespace core = rescuecp::core;
using core::CopyMode;
using core::ReadFrom;

TEST(SourceSelectorTest, FreshAlwaysReadsSourceWithFullBudget)
{
    core::Ledger ledger({{.offset = 0, .size = 4096}});
    core::SourceSelector selector(CopyMode::Fresh, &ledger, 7);

    for (std::uint64_t pos : {0ull, 4096ull, 1ull << 40}) {
        auto s = selector.select(pos);
        EXPECT_EQ(s.from, ReadFrom::Source);
        EXPECT_EQ(s.max_retries, 7);
    }
}

TEST(SourceSelectorTest, FreshWithoutLedger)
{
    core::SourceSelector selector(CopyMode::Fresh, nullptr, 2);
    EXPECT_EQ(selector.select(0).from, ReadFrom::Source);
}

TEST(SourceSelectorTest, OverwriteRereadsOnlyKnownBadBlocks)
{
    core::Ledger ledger({{.offset = 100, .size = 100}});
    core::SourceSelector selector(CopyMode::OverwriteBadOnly, &ledger, 3);

    EXPECT_EQ(selector.select(0).from, ReadFrom::Skip);
    EXPECT_EQ(selector.select(99).from, ReadFrom::Skip);

    auto inside = selector.select(100);
    EXPECT_EQ(inside.from, ReadFrom::Source);
    EXPECT_EQ(inside.max_retries, 3);

    EXPECT_EQ(selector.select(199).from, ReadFrom::Source);
    EXPECT_EQ(selector.select(200).from, ReadFrom::Skip);
}

TEST(SourceSelectorTest, MergeReadsGoodRangesFromPartialWithoutRetries)
{
    core::Ledger partial_ledger({{.offset = 0, .size = 50}});
    core::SourceSelector selector(CopyMode::MergeFromPartial, &partial_ledger, 4);

    auto bad = selector.select(0);
    EXPECT_EQ(bad.from, ReadFrom::Source);
    EXPECT_EQ(bad.max_retries, 4);

    auto good = selector.select(50);
    EXPECT_EQ(good.from, ReadFrom::Partial);
    EXPECT_EQ(good.max_retries, 0);
}

TEST(SourceSelectorTest, OverlappingEntriesStillCount)
{
    core::Ledger ledger({{.offset = 300, .size = 100}, {.offset = 0, .size = 200}, {.offset = 150, .size = 100}});
    core::SourceSelector selector(CopyMode::OverwriteBadOnly, &ledger, 0);

    EXPECT_EQ(selector.select(0).from, ReadFrom::Source);
    EXPECT_EQ(selector.select(220).from, ReadFrom::Source);
    EXPECT_EQ(selector.select(260).from, ReadFrom::Skip);
    EXPECT_EQ(selector.select(350).from, ReadFrom::Source);
}

TEST(SourceSelectorTest, ModeNames)
{
    EXPECT_EQ(core::to_string(CopyMode::Fresh), "fresh");
    EXPECT_EQ(core::to_string(CopyMode::OverwriteBadOnly), "overwrite-bad-only");
    EXPECT_EQ(core::to_string(CopyMode::MergeFromPartial), "merge-from-partial");
}
