#include <gtest/gtest.h>
#include <chrono>
#include "engine/caching/ttl_policy.hpp"
#include "engine/common/config_manager.hpp"

using namespace mdstream::engine::caching;
using mdstream::engine::common::ConfigManager;
using std::chrono::seconds;

TEST(TtlPolicyTest, DefaultTable) {
  TtlPolicy policy;
  EXPECT_EQ(policy.GetTtl(MarketStatus::kTrading, DataKind::kRealtime), seconds(5));
  EXPECT_EQ(policy.GetTtl(MarketStatus::kTrading, DataKind::kAnalytical), seconds(60));
  EXPECT_EQ(policy.GetTtl(MarketStatus::kPreMarket, DataKind::kRealtime), seconds(15));
  EXPECT_EQ(policy.GetTtl(MarketStatus::kAfterHours, DataKind::kAnalytical), seconds(600));
  EXPECT_EQ(policy.GetTtl(MarketStatus::kLunchBreak, DataKind::kRealtime), seconds(60));
  EXPECT_EQ(policy.GetTtl(MarketStatus::kMarketClosed, DataKind::kRealtime), seconds(3600));
  EXPECT_EQ(policy.GetTtl(MarketStatus::kWeekend, DataKind::kRealtime), seconds(7200));
  EXPECT_EQ(policy.GetTtl(MarketStatus::kHoliday, DataKind::kAnalytical), seconds(14400));
}

TEST(TtlPolicyTest, QuietSessionsNeverShortenTtl) {
  TtlPolicy policy;
  for (DataKind kind : {DataKind::kRealtime, DataKind::kAnalytical}) {
    EXPECT_LE(policy.GetTtl(MarketStatus::kTrading, kind), policy.GetTtl(MarketStatus::kPreMarket, kind));
    EXPECT_LE(policy.GetTtl(MarketStatus::kMarketClosed, kind), policy.GetTtl(MarketStatus::kWeekend, kind));
    EXPECT_LE(policy.GetTtl(MarketStatus::kWeekend, kind), policy.GetTtl(MarketStatus::kHoliday, kind));
  }
}

TEST(TtlPolicyTest, ConfigOverridesSingleCells) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromString(R"({
    "cache": {
      "ttl": {
        "realtime": {"TRADING_s": 2, "WEEKEND_s": -1},
        "analytical": {"HOLIDAY_s": 86400}
      }
    }
  })"));
  auto policy = TtlPolicy::FromConfig(config);
  EXPECT_EQ(policy.GetTtl(MarketStatus::kTrading, DataKind::kRealtime), seconds(2));
  EXPECT_EQ(policy.GetTtl(MarketStatus::kHoliday, DataKind::kAnalytical), seconds(86400));
  // Non-positive values keep the default
  EXPECT_EQ(policy.GetTtl(MarketStatus::kWeekend, DataKind::kRealtime), seconds(7200));
  EXPECT_EQ(policy.GetTtl(MarketStatus::kTrading, DataKind::kAnalytical), seconds(60));
}

TEST(TtlPolicyTest, SetTtl) {
  TtlPolicy policy;
  policy.SetTtl(MarketStatus::kLunchBreak, DataKind::kAnalytical, seconds(30));
  EXPECT_EQ(policy.GetTtl(MarketStatus::kLunchBreak, DataKind::kAnalytical), seconds(30));
  EXPECT_STREQ(ToString(DataKind::kAnalytical), "analytical");
}
