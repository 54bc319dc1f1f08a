#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include "engine/caching/cache_tier_manager.hpp"
#include "engine/common/metrics_emitter.hpp"
#include "test_clock.hpp"

using namespace mdstream::engine::caching;
using mdstream::engine::common::CountingMetricsEmitter;
using mdstream::engine::common::WallClock;
using mdstream::test::ManualClock;

namespace {

WallClock::time_point Utc(int y, unsigned m, unsigned d, int hour) {
  return std::chrono::sys_days{std::chrono::year{y} / m / d} + std::chrono::hours(hour);
}

// Warm backend that is always down
class BrokenWarmStore : public WarmStore {
 public:
  void Set(const CacheEntry&, std::chrono::milliseconds) override { throw std::runtime_error("connection refused"); }
  std::optional<CacheEntry> Get(const std::string&) override { throw std::runtime_error("connection refused"); }
  bool Delete(const std::string&) override { throw std::runtime_error("connection refused"); }
  std::vector<std::string> ScanPrefix(const std::string&) override { throw std::runtime_error("connection refused"); }
};

MarketContext Trading() {
  MarketContext context;
  context.status = MarketStatus::kTrading;
  return context;
}

}  // namespace

class CacheTierManagerTest : public ::testing::Test {
 protected:
  // Monday 2026-01-05 10:00 EST, US and crypto markets trading
  CacheTierManagerTest() : clock_(Utc(2026, 1, 5, 15)) {}

  std::unique_ptr<CacheTierManager> Make(std::shared_ptr<WarmStore> warm, CacheTierOptions options = {}) {
    return std::make_unique<CacheTierManager>(options, std::move(warm), calendar_, TtlPolicy(), &metrics_,
                                              clock_.WallSource());
  }

  ManualClock clock_;
  CountingMetricsEmitter metrics_;
  std::shared_ptr<MarketSessionCalendar> calendar_ = std::make_shared<MarketSessionCalendar>(clock_.WallSource());
  std::shared_ptr<InMemoryWarmStore> warm_ = std::make_shared<InMemoryWarmStore>(clock_.WallSource());
};

TEST_F(CacheTierManagerTest, RequiresCalendar) {
  EXPECT_THROW(CacheTierManager(CacheTierOptions{}, nullptr, nullptr), std::invalid_argument);
}

TEST_F(CacheTierManagerTest, TtlFollowsMarketStatus) {
  auto cache = Make(warm_);
  MarketContext context;
  EXPECT_EQ(cache->ComputeTtl("quote:AAPL", context), std::chrono::seconds(5));
  EXPECT_EQ(cache->ComputeTtl("quote:00700.HK", context), std::chrono::seconds(3600));

  context.kind = DataKind::kAnalytical;
  EXPECT_EQ(cache->ComputeTtl("fundamentals:AAPL", context), std::chrono::seconds(60));

  // Saturday
  clock_.SetWall(Utc(2026, 1, 10, 15));
  EXPECT_EQ(cache->ResolveStatus("quote:AAPL", MarketContext{}), MarketStatus::kWeekend);
  EXPECT_EQ(cache->ResolveStatus("quote:BTCUSDT", MarketContext{}), MarketStatus::kTrading);

  MarketContext pinned;
  pinned.market = Market::kHK;
  EXPECT_EQ(cache->ResolveStatus("quote:AAPL", pinned), MarketStatus::kWeekend);
  pinned.ttl_override = std::chrono::milliseconds(2500);
  EXPECT_EQ(cache->ComputeTtl("quote:AAPL", pinned).count(), 2500);
}

TEST_F(CacheTierManagerTest, HotHitUntilExpiry) {
  auto cache = Make(warm_);
  auto stored = cache->Set("quote:AAPL", "189.25", Trading());
  EXPECT_EQ(stored.ttl, std::chrono::seconds(5));
  EXPECT_EQ(stored.category, "quote");
  EXPECT_EQ(stored.status, MarketStatus::kTrading);

  auto hit = cache->Lookup("quote:AAPL");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->tier, CacheTier::kHot);
  EXPECT_EQ(hit->entry.Value(), "189.25");

  clock_.Advance(std::chrono::seconds(5));
  EXPECT_FALSE(cache->Get("quote:AAPL").has_value());

  auto stats = cache->GetStats();
  EXPECT_EQ(stats.hot_hits, 1u);
  EXPECT_EQ(stats.misses, 1u);
  EXPECT_DOUBLE_EQ(metrics_.GetCount("cache.miss"), 1.0);
}

TEST_F(CacheTierManagerTest, ShortTtlIsFlooredPerTier) {
  auto cache = Make(warm_);
  MarketContext context;
  context.ttl_override = std::chrono::milliseconds(100);
  auto stored = cache->Set("quote:AAPL", "1", context);
  EXPECT_EQ(stored.ttl.count(), 1000);
  EXPECT_EQ(stored.expires_ms - stored.created_ms, 1000);
}

TEST_F(CacheTierManagerTest, StaleEntriesStayWithinRetention) {
  auto cache = Make(warm_);
  cache->Set("quote:AAPL", "189.25", Trading());

  clock_.Advance(std::chrono::seconds(30));
  EXPECT_FALSE(cache->Get("quote:AAPL").has_value());
  auto stale = cache->GetStale("quote:AAPL");
  ASSERT_TRUE(stale.has_value());
  EXPECT_EQ(stale->Value(), "189.25");

  clock_.Advance(std::chrono::hours(1));
  EXPECT_FALSE(cache->GetStale("quote:AAPL").has_value());
  EXPECT_EQ(cache->GetStats().stale_hits, 1u);
}

TEST_F(CacheTierManagerTest, WarmHitIsPromoted) {
  auto writer = Make(warm_);
  auto reader = Make(warm_);
  MarketContext context;
  context.kind = DataKind::kAnalytical;
  writer->Set("fundamentals:AAPL", "{}", context);

  auto first = reader->Lookup("fundamentals:AAPL");
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->tier, CacheTier::kWarm);
  auto second = reader->Lookup("fundamentals:AAPL");
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->tier, CacheTier::kHot);

  auto stats = reader->GetStats();
  EXPECT_EQ(stats.warm_hits, 1u);
  EXPECT_EQ(stats.hot_hits, 1u);
}

TEST_F(CacheTierManagerTest, CompressionDependsOnProfile) {
  auto cache = Make(warm_);
  const std::string payload(2000, 'a');

  MarketContext streaming = Trading();
  auto compressed = cache->Set("depth:AAPL", payload, streaming);
  EXPECT_TRUE(compressed.compressed);
  EXPECT_LT(compressed.data.size(), payload.size());
  EXPECT_EQ(cache->Get("depth:AAPL")->Value(), payload);

  MarketContext batch = Trading();
  batch.profile = CompressionProfile::kBatch;
  EXPECT_FALSE(cache->Set("kline:AAPL", payload, batch).compressed);
  EXPECT_EQ(cache->GetStats().compressed_sets, 1u);
}

TEST_F(CacheTierManagerTest, CompressionFailureIsCounted) {
  CacheTierOptions options;
  options.compression.level = 42;  // rejected by zlib
  auto cache = Make(warm_, options);
  const std::string payload(2000, 'a');

  auto entry = cache->Set("depth:AAPL", payload, Trading());
  EXPECT_FALSE(entry.compressed);
  EXPECT_EQ(entry.data, payload);
  EXPECT_EQ(cache->Get("depth:AAPL")->Value(), payload);

  auto stats = cache->GetStats();
  EXPECT_EQ(stats.compressed_sets, 0u);
  EXPECT_EQ(stats.compression_failures, 1u);
  EXPECT_EQ(stats.ToJson()["compression_failures"], 1);
  EXPECT_DOUBLE_EQ(metrics_.GetCount("cache.compression_failed"), 1.0);

  // Payloads under the threshold never reach zlib
  cache->Set("quote:AAPL", "189.25", Trading());
  EXPECT_EQ(cache->GetStats().compression_failures, 1u);
}

TEST_F(CacheTierManagerTest, StatusAndTtlComeFromOneCalendarRead) {
  // Every read of this calendar's clock moves an hour on, across the US close
  auto next = std::make_shared<WallClock::time_point>(Utc(2026, 1, 5, 20) + std::chrono::minutes(30));
  auto calendar = std::make_shared<MarketSessionCalendar>([next] {
    const auto now = *next;
    *next += std::chrono::hours(1);
    return now;
  });
  CacheTierManager cache(CacheTierOptions{}, warm_, calendar, TtlPolicy(), &metrics_, clock_.WallSource());

  TtlPolicy policy;
  ASSERT_NE(policy.GetTtl(MarketStatus::kTrading, DataKind::kRealtime),
            policy.GetTtl(calendar->GetStatus(Market::kUS, Utc(2026, 1, 5, 22)), DataKind::kRealtime));

  for (int i = 0; i < 3; ++i) {
    auto entry = cache.Set("quote:AAPL", "189.25", MarketContext{});
    const std::chrono::milliseconds expected = policy.GetTtl(entry.status, DataKind::kRealtime);
    EXPECT_EQ(entry.ttl, std::max(expected, CacheTierOptions{}.min_hot_ttl)) << ToString(entry.status);
  }
}

TEST_F(CacheTierManagerTest, InvalidatePatterns) {
  auto cache = Make(warm_);
  cache->Set("quote:AAPL", "1", Trading());
  cache->Set("quote:AMZN", "2", Trading());
  cache->Set("quote:MSFT", "3", Trading());
  cache->Set("kline:AAPL", "4", Trading());

  // Hot and warm copies both count
  EXPECT_EQ(cache->Invalidate("quote:AM*"), 2u);
  EXPECT_EQ(cache->Invalidate("kline:AAPL"), 2u);
  EXPECT_EQ(cache->Invalidate("quote:*"), 4u);
  EXPECT_EQ(cache->Invalidate(""), 0u);

  EXPECT_FALSE(cache->Get("quote:AAPL").has_value());
  EXPECT_EQ(warm_->Size(), 0u);
  EXPECT_EQ(cache->GetStats().invalidations, 3u);
}

TEST_F(CacheTierManagerTest, ExplicitCategoryOverridesKeyPrefix) {
  auto cache = Make(nullptr);
  MarketContext context = Trading();
  context.category = "watchlist";
  cache->Set("user42:AAPL", "1", context);
  EXPECT_EQ(cache->Invalidate("watchlist:*"), 1u);
  EXPECT_EQ(cache->GetStats().hot_size, 0u);
}

TEST_F(CacheTierManagerTest, WarmFailuresAreAbsorbed) {
  auto cache = Make(std::make_shared<BrokenWarmStore>());
  EXPECT_NO_THROW(cache->Set("quote:AAPL", "1", Trading()));
  EXPECT_TRUE(cache->Get("quote:AAPL").has_value());

  clock_.Advance(std::chrono::seconds(10));
  EXPECT_NO_THROW({ EXPECT_FALSE(cache->Get("quote:AAPL").has_value()); });
  EXPECT_NO_THROW(cache->Invalidate("quote:*"));

  auto stats = cache->GetStats();
  EXPECT_GE(stats.warm_errors, 3u);
  EXPECT_EQ(stats.hot_hits, 1u);
}

TEST_F(CacheTierManagerTest, HotCapacityEvicts) {
  CacheTierOptions options;
  options.hot_capacity = 2;
  auto cache = Make(nullptr, options);
  cache->Set("quote:A", "1", Trading());
  cache->Set("quote:B", "2", Trading());
  cache->Set("quote:C", "3", Trading());

  auto stats = cache->GetStats();
  EXPECT_EQ(stats.hot_size, 2u);
  EXPECT_EQ(stats.evictions, 1u);
  EXPECT_FALSE(cache->Get("quote:A").has_value());
}
