// Repository: pixelctl
// Component: Preview Cache Tests
// Purpose: LRU order, byte budget and oversized-entry handling.
// Copyright (c) 2026 Pixelctl

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "pixelctl/preview/PreviewCache.hpp"
#include "support/DeterministicTimeSource.hpp"

namespace pixelctl::preview::testing {
namespace {

using pixelctl::testing::DeterministicTimeSource;

PreviewKey Key(const std::string& path) {
  PreviewKey k;
  k.path = path;
  return k;
}

PreviewBytes Bytes(size_t n, char fill = 'x') {
  return std::make_shared<const std::string>(n, fill);
}

class PreviewCacheTest : public ::testing::Test {
 protected:
  PreviewCacheTest() : time_(10'000), cache_(30, time_) {}

  DeterministicTimeSource time_;
  PreviewCache cache_;
};

TEST_F(PreviewCacheTest, LookupMissThenHit) {
  EXPECT_EQ(cache_.Lookup(Key("a")), nullptr);
  PreviewBytes a = Bytes(10);
  EXPECT_EQ(cache_.Insert(Key("a"), a), InsertOutcome::kInserted);

  PreviewBytes hit = cache_.Lookup(Key("a"));
  ASSERT_NE(hit, nullptr);
  EXPECT_EQ(hit.get(), a.get());

  PreviewCacheStats stats = cache_.Stats();
  EXPECT_EQ(stats.hits, 1u);
  EXPECT_EQ(stats.misses, 1u);
  EXPECT_EQ(stats.entries, 1u);
  EXPECT_EQ(stats.bytes_used, 10u);
}

TEST_F(PreviewCacheTest, EvictsLeastRecentlyAccessed) {
  cache_.Insert(Key("a"), Bytes(10));
  time_.AdvanceMs(1);
  cache_.Insert(Key("b"), Bytes(10));
  time_.AdvanceMs(1);
  cache_.Insert(Key("c"), Bytes(10));
  time_.AdvanceMs(1);
  ASSERT_NE(cache_.Lookup(Key("a")), nullptr);

  time_.AdvanceMs(1);
  cache_.Insert(Key("d"), Bytes(10));

  EXPECT_TRUE(cache_.Contains(Key("a")));
  EXPECT_FALSE(cache_.Contains(Key("b")));
  EXPECT_TRUE(cache_.Contains(Key("c")));
  EXPECT_TRUE(cache_.Contains(Key("d")));
  EXPECT_EQ(cache_.Stats().evictions, 1u);

  auto order = cache_.KeysByRecency();
  ASSERT_EQ(order.size(), 3u);
  EXPECT_EQ(order[0].path, "c");
  EXPECT_EQ(order[1].path, "a");
  EXPECT_EQ(order[2].path, "d");
}

TEST_F(PreviewCacheTest, LargeInsertEvictsSeveralEntries) {
  cache_.Insert(Key("a"), Bytes(10));
  cache_.Insert(Key("b"), Bytes(10));
  cache_.Insert(Key("c"), Bytes(10));
  cache_.Insert(Key("big"), Bytes(25));

  EXPECT_EQ(cache_.Size(), 1u);
  EXPECT_TRUE(cache_.Contains(Key("big")));
  EXPECT_EQ(cache_.BytesUsed(), 25u);
  EXPECT_EQ(cache_.Stats().evictions, 3u);
}

TEST_F(PreviewCacheTest, EntryLargerThanBudgetIsNotStored) {
  cache_.Insert(Key("a"), Bytes(10));
  EXPECT_EQ(cache_.Insert(Key("huge"), Bytes(31)), InsertOutcome::kTooLarge);
  EXPECT_FALSE(cache_.Contains(Key("huge")));
  // Nothing was evicted to make room for it.
  EXPECT_TRUE(cache_.Contains(Key("a")));
  EXPECT_EQ(cache_.Stats().rejected_too_large, 1u);
}

TEST_F(PreviewCacheTest, EntryExactlyAtBudgetFits) {
  EXPECT_EQ(cache_.Insert(Key("full"), Bytes(30)), InsertOutcome::kInserted);
  EXPECT_EQ(cache_.BytesUsed(), 30u);
}

TEST_F(PreviewCacheTest, ReplaceAdjustsAccounting) {
  cache_.Insert(Key("a"), Bytes(10, '1'));
  EXPECT_EQ(cache_.Insert(Key("a"), Bytes(20, '2')), InsertOutcome::kReplaced);
  EXPECT_EQ(cache_.Size(), 1u);
  EXPECT_EQ(cache_.BytesUsed(), 20u);
  EXPECT_EQ(*cache_.Lookup(Key("a")), std::string(20, '2'));

  // An oversized replacement drops the old entry too.
  EXPECT_EQ(cache_.Insert(Key("a"), Bytes(40)), InsertOutcome::kTooLarge);
  EXPECT_FALSE(cache_.Contains(Key("a")));
  EXPECT_EQ(cache_.BytesUsed(), 0u);
}

TEST_F(PreviewCacheTest, BudgetHoldsAfterEveryInsert) {
  for (int i = 0; i < 50; ++i) {
    cache_.Insert(Key("k" + std::to_string(i)), Bytes(static_cast<size_t>(1 + i % 13)));
    ASSERT_LE(cache_.BytesUsed(), cache_.budget_bytes()) << "after insert " << i;
  }
}

TEST_F(PreviewCacheTest, OptionsArePartOfTheKey) {
  PreviewKey small = Key("a");
  PreviewKey large = Key("a");
  large.options.width_cells = 80;
  cache_.Insert(small, Bytes(5, 's'));
  cache_.Insert(large, Bytes(5, 'l'));
  EXPECT_EQ(cache_.Size(), 2u);
  EXPECT_EQ(*cache_.Lookup(large), std::string(5, 'l'));

  PreviewKey kitty = Key("a");
  kitty.options.protocol = TerminalProtocol::kKitty;
  EXPECT_EQ(cache_.Lookup(kitty), nullptr);
}

TEST_F(PreviewCacheTest, LookupRefreshesLastAccess) {
  cache_.Insert(Key("a"), Bytes(5));
  EXPECT_EQ(cache_.LastAccessMs(Key("a")).value(), 10'000);
  time_.AdvanceMs(500);
  EXPECT_EQ(cache_.LastAccessMs(Key("a")).value(), 10'000);
  cache_.Lookup(Key("a"));
  EXPECT_EQ(cache_.LastAccessMs(Key("a")).value(), 10'500);
}

TEST_F(PreviewCacheTest, ClearResetsBytesButKeepsCounters) {
  cache_.Insert(Key("a"), Bytes(10));
  cache_.Lookup(Key("a"));
  cache_.Clear();
  EXPECT_EQ(cache_.Size(), 0u);
  EXPECT_EQ(cache_.BytesUsed(), 0u);
  EXPECT_EQ(cache_.Stats().hits, 1u);
  EXPECT_EQ(cache_.Insert(Key("a"), Bytes(30)), InsertOutcome::kInserted);
}

}  // namespace
}  // namespace pixelctl::preview::testing
