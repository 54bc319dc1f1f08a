#include <gtest/gtest.h>
#include <chrono>
#include "engine/caching/market_session.hpp"
#include "engine/common/config_manager.hpp"
#include "test_clock.hpp"

using namespace mdstream::engine::caching;
using mdstream::engine::common::ConfigManager;
using mdstream::engine::common::WallClock;
using mdstream::test::ManualClock;

namespace {

// UTC instant
WallClock::time_point Utc(int year, unsigned month, unsigned day, int hour, int minute = 0) {
  using namespace std::chrono;
  return sys_days{std::chrono::year{year} / month / day} + hours(hour) + minutes(minute);
}

}  // namespace

class MarketSessionTest : public ::testing::Test {
 protected:
  MarketSessionCalendar calendar_;
};

TEST_F(MarketSessionTest, UsRegularSessionInWinter) {
  // Monday 2026-01-05, EST (UTC-5)
  EXPECT_EQ(calendar_.GetStatus(Market::kUS, Utc(2026, 1, 5, 14, 29)), MarketStatus::kPreMarket);
  EXPECT_EQ(calendar_.GetStatus(Market::kUS, Utc(2026, 1, 5, 14, 30)), MarketStatus::kTrading);
  EXPECT_EQ(calendar_.GetStatus(Market::kUS, Utc(2026, 1, 5, 20, 59)), MarketStatus::kTrading);
  EXPECT_EQ(calendar_.GetStatus(Market::kUS, Utc(2026, 1, 5, 21, 0)), MarketStatus::kAfterHours);
  EXPECT_EQ(calendar_.GetStatus(Market::kUS, Utc(2026, 1, 6, 2, 0)), MarketStatus::kMarketClosed);
  EXPECT_EQ(calendar_.GetStatus(Market::kUS, Utc(2026, 1, 5, 8, 0)), MarketStatus::kMarketClosed);
}

TEST_F(MarketSessionTest, UsSessionShiftsWithDaylightSaving) {
  // Monday 2026-07-06, EDT (UTC-4)
  EXPECT_EQ(calendar_.GetStatus(Market::kUS, Utc(2026, 7, 6, 13, 30)), MarketStatus::kTrading);
  EXPECT_EQ(calendar_.GetStatus(Market::kUS, Utc(2026, 1, 5, 13, 30)), MarketStatus::kPreMarket);
}

TEST_F(MarketSessionTest, UsDaylightSavingBoundaries) {
  // 2026: starts Sunday March 8, ends Sunday November 1, at 02:00 local
  EXPECT_EQ(MarketSessionCalendar::UtcOffsetMinutes(Market::kUS, Utc(2026, 3, 8, 6, 59)), -300);
  EXPECT_EQ(MarketSessionCalendar::UtcOffsetMinutes(Market::kUS, Utc(2026, 3, 8, 7, 0)), -240);
  EXPECT_EQ(MarketSessionCalendar::UtcOffsetMinutes(Market::kUS, Utc(2026, 11, 1, 5, 59)), -240);
  EXPECT_EQ(MarketSessionCalendar::UtcOffsetMinutes(Market::kUS, Utc(2026, 11, 1, 6, 0)), -300);
  EXPECT_EQ(MarketSessionCalendar::UtcOffsetMinutes(Market::kHK, Utc(2026, 7, 6, 0)), 480);
  EXPECT_EQ(MarketSessionCalendar::UtcOffsetMinutes(Market::kCrypto, Utc(2026, 7, 6, 0)), 0);
}

TEST_F(MarketSessionTest, HongKongSessions) {
  // Monday 2026-01-05, UTC+8
  EXPECT_EQ(calendar_.GetStatus(Market::kHK, Utc(2026, 1, 5, 1, 15)), MarketStatus::kPreMarket);
  EXPECT_EQ(calendar_.GetStatus(Market::kHK, Utc(2026, 1, 5, 2, 0)), MarketStatus::kTrading);
  EXPECT_EQ(calendar_.GetStatus(Market::kHK, Utc(2026, 1, 5, 4, 30)), MarketStatus::kLunchBreak);
  EXPECT_EQ(calendar_.GetStatus(Market::kHK, Utc(2026, 1, 5, 5, 0)), MarketStatus::kTrading);
  EXPECT_EQ(calendar_.GetStatus(Market::kHK, Utc(2026, 1, 5, 8, 30)), MarketStatus::kMarketClosed);
}

TEST_F(MarketSessionTest, MainlandLunchBreakStartsEarlier) {
  // 11:45 local
  const auto at = Utc(2026, 1, 5, 3, 45);
  EXPECT_EQ(calendar_.GetStatus(Market::kSH, at), MarketStatus::kLunchBreak);
  EXPECT_EQ(calendar_.GetStatus(Market::kSZ, at), MarketStatus::kLunchBreak);
  EXPECT_EQ(calendar_.GetStatus(Market::kHK, at), MarketStatus::kTrading);
}

TEST_F(MarketSessionTest, WeekendUsesLocalDate) {
  // Saturday 2026-01-03 10:00 HKT
  EXPECT_EQ(calendar_.GetStatus(Market::kHK, Utc(2026, 1, 3, 2, 0)), MarketStatus::kWeekend);
  // Monday 01:30 UTC is still Sunday evening in New York
  EXPECT_EQ(calendar_.GetStatus(Market::kUS, Utc(2026, 1, 5, 1, 30)), MarketStatus::kWeekend);
}

TEST_F(MarketSessionTest, HolidaysAreLocalDates) {
  calendar_.AddHoliday(Market::kUS, "2026-12-25");
  EXPECT_TRUE(calendar_.IsHoliday(Market::kUS, "2026-12-25"));
  EXPECT_FALSE(calendar_.IsHoliday(Market::kHK, "2026-12-25"));

  // Friday 10:00 EST
  EXPECT_EQ(calendar_.GetStatus(Market::kUS, Utc(2026, 12, 25, 15, 0)), MarketStatus::kHoliday);
  EXPECT_EQ(calendar_.GetStatus(Market::kHK, Utc(2026, 12, 25, 2, 0)), MarketStatus::kTrading);
}

TEST_F(MarketSessionTest, LoadHolidaysFromConfig) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromString(R"({
    "market_session": {
      "holidays": {
        "HK": ["2026-12-25", "2026-12-26"],
        "MARS": ["2026-01-01"]
      }
    }
  })"));
  calendar_.LoadFromConfig(config);
  EXPECT_TRUE(calendar_.IsHoliday(Market::kHK, "2026-12-26"));
  EXPECT_FALSE(calendar_.IsHoliday(Market::kUS, "2026-12-25"));
}

TEST_F(MarketSessionTest, CryptoAndUnknownMarkets) {
  EXPECT_EQ(calendar_.GetStatus(Market::kCrypto, Utc(2026, 1, 3, 2, 0)), MarketStatus::kTrading);
  EXPECT_EQ(calendar_.GetStatus(Market::kUnknown, Utc(2026, 1, 5, 15, 0)), MarketStatus::kMarketClosed);
}

TEST_F(MarketSessionTest, CurrentStatusUsesWallSource) {
  ManualClock clock(Utc(2026, 1, 5, 15, 0));
  MarketSessionCalendar calendar(clock.WallSource());
  EXPECT_EQ(calendar.GetCurrentStatus(Market::kUS), MarketStatus::kTrading);
  clock.Advance(std::chrono::hours(11));
  EXPECT_EQ(calendar.GetCurrentStatus(Market::kUS), MarketStatus::kMarketClosed);
}

TEST(MarketInferenceTest, InferMarketFromSymbol) {
  EXPECT_EQ(MarketSessionCalendar::InferMarket("00700.HK"), Market::kHK);
  EXPECT_EQ(MarketSessionCalendar::InferMarket("000001.SZ"), Market::kSZ);
  EXPECT_EQ(MarketSessionCalendar::InferMarket("600000.sh"), Market::kSH);
  EXPECT_EQ(MarketSessionCalendar::InferMarket("TSLA.US"), Market::kUS);
  EXPECT_EQ(MarketSessionCalendar::InferMarket("600000"), Market::kSH);
  EXPECT_EQ(MarketSessionCalendar::InferMarket("000001"), Market::kSZ);
  EXPECT_EQ(MarketSessionCalendar::InferMarket("00700"), Market::kHK);
  EXPECT_EQ(MarketSessionCalendar::InferMarket("BTCUSDT"), Market::kCrypto);
  EXPECT_EQ(MarketSessionCalendar::InferMarket("aapl"), Market::kUS);
  EXPECT_EQ(MarketSessionCalendar::InferMarket("ABCDEFG"), Market::kUnknown);
  EXPECT_EQ(MarketSessionCalendar::InferMarket(""), Market::kUnknown);
}

TEST(MarketInferenceTest, ParseMarketNames) {
  EXPECT_EQ(ParseMarket("CRYPTO"), Market::kCrypto);
  EXPECT_EQ(ParseMarket(ToString(Market::kSZ)), Market::kSZ);
  EXPECT_EQ(ParseMarket("hk"), Market::kUnknown);
  EXPECT_STREQ(ToString(MarketStatus::kLunchBreak), "LUNCH_BREAK");
}
