#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include "engine/caching/hot_tier.hpp"
#include "engine/caching/warm_store.hpp"
#include "test_clock.hpp"

using namespace mdstream::engine::caching;
using mdstream::test::ManualClock;

namespace {

CacheEntry MakeEntry(const std::string& key, const std::string& value = "v") {
  CacheEntry entry;
  entry.key = key;
  entry.data = value;
  entry.original_size = value.size();
  entry.category = CategoryOf(key);
  entry.expires_ms = 1000;
  return entry;
}

}  // namespace

TEST(HotTierTest, EvictsLeastRecentlyUsed) {
  HotTier tier(2);
  tier.Put(MakeEntry("quote:A"));
  tier.Put(MakeEntry("quote:B"));
  ASSERT_TRUE(tier.Get("quote:A").has_value());

  EXPECT_EQ(tier.Put(MakeEntry("quote:C")), 1u);
  EXPECT_TRUE(tier.Get("quote:A").has_value());
  EXPECT_FALSE(tier.Get("quote:B").has_value());
  EXPECT_TRUE(tier.Get("quote:C").has_value());
  EXPECT_EQ(tier.GetEvictions(), 1u);
  EXPECT_TRUE(tier.IsIndexConsistent());
}

TEST(HotTierTest, PutReplacesExistingKey) {
  HotTier tier(4);
  tier.Put(MakeEntry("quote:A", "old"));
  tier.Put(MakeEntry("quote:A", "new"));
  EXPECT_EQ(tier.Size(), 1u);
  EXPECT_EQ(tier.Get("quote:A")->data, "new");
  EXPECT_TRUE(tier.IsIndexConsistent());
}

TEST(HotTierTest, EraseCategoryUsesIndex) {
  HotTier tier(10);
  tier.Put(MakeEntry("quote:A"));
  tier.Put(MakeEntry("quote:B"));
  tier.Put(MakeEntry("kline:A"));
  tier.Put(MakeEntry("nocategory"));

  EXPECT_EQ(tier.EraseCategory("quote"), 2u);
  EXPECT_EQ(tier.EraseCategory("missing"), 0u);
  EXPECT_EQ(tier.Size(), 2u);
  EXPECT_EQ(tier.GetIndexFallbacks(), 0u);
  EXPECT_TRUE(tier.Get("kline:A").has_value());
  EXPECT_TRUE(tier.IsIndexConsistent());
}

TEST(HotTierTest, OverflowedCategoryFallsBackToScan) {
  HotTier tier(100, 2);
  for (int i = 0; i < 5; ++i) {
    tier.Put(MakeEntry("quote:S" + std::to_string(i)));
  }
  tier.Put(MakeEntry("kline:A"));
  EXPECT_TRUE(tier.IsIndexConsistent());

  EXPECT_EQ(tier.EraseCategory("quote"), 5u);
  EXPECT_EQ(tier.GetIndexFallbacks(), 1u);
  EXPECT_EQ(tier.Size(), 1u);
  EXPECT_TRUE(tier.IsIndexConsistent());

  // The index is rebuilt; the category is indexable again
  tier.Put(MakeEntry("quote:X"));
  EXPECT_EQ(tier.EraseCategory("quote"), 1u);
  EXPECT_EQ(tier.GetIndexFallbacks(), 1u);
}

TEST(HotTierTest, ErasePrefixScansKeys) {
  HotTier tier(10);
  tier.Put(MakeEntry("quote:AAPL"));
  tier.Put(MakeEntry("quote:AMZN"));
  tier.Put(MakeEntry("quote:MSFT"));

  EXPECT_EQ(tier.ErasePrefix("quote:A"), 2u);
  EXPECT_EQ(tier.Size(), 1u);
  EXPECT_TRUE(tier.Erase("quote:MSFT"));
  EXPECT_FALSE(tier.Erase("quote:MSFT"));
  EXPECT_TRUE(tier.IsIndexConsistent());
}

TEST(InMemoryWarmStoreTest, ExpiresByTtl) {
  ManualClock clock;
  InMemoryWarmStore store(clock.WallSource());
  store.Set(MakeEntry("quote:A"), std::chrono::seconds(10));
  store.Set(MakeEntry("quote:B"), std::chrono::seconds(30));
  store.Set(MakeEntry("kline:A"), std::chrono::seconds(30));

  EXPECT_TRUE(store.Get("quote:A").has_value());
  EXPECT_EQ(store.ScanPrefix("quote:"), (std::vector<std::string>{"quote:A", "quote:B"}));

  clock.Advance(std::chrono::seconds(10));
  EXPECT_FALSE(store.Get("quote:A").has_value());
  EXPECT_EQ(store.ScanPrefix("quote:"), (std::vector<std::string>{"quote:B"}));
  EXPECT_EQ(store.Size(), 2u);

  EXPECT_TRUE(store.Delete("kline:A"));
  EXPECT_FALSE(store.Delete("kline:A"));
}
