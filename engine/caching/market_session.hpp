#pragma once

#include "engine/common/config_manager.hpp"
#include "engine/common/time_source.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>

namespace mdstream {
namespace engine {
namespace caching {

enum class Market { kHK, kUS, kSZ, kSH, kCN, kCrypto, kUnknown };

enum class MarketStatus {
  kMarketClosed,
  kPreMarket,
  kTrading,
  kLunchBreak,
  kAfterHours,
  kHoliday,
  kWeekend
};

const char* ToString(Market market);
const char* ToString(MarketStatus status);

// Accepts the names produced by ToString(); returns kUnknown otherwise
Market ParseMarket(const std::string& name);

/**
 * @brief Trading session calendar per market
 *
 * Sessions are evaluated in exchange-local time using a fixed UTC offset;
 * the US market applies daylight saving (second Sunday of March through
 * the first Sunday of November). Holidays are exchange-local dates in
 * YYYY-MM-DD form. Crypto trades around the clock.
 */
class MarketSessionCalendar {
 public:
  explicit MarketSessionCalendar(common::WallTimeSource wall_time_source = common::DefaultWallTimeSource());

  // market_session.holidays.<MARKET> = ["2024-12-25", ...]
  void LoadFromConfig(const common::ConfigManager& config);

  void AddHoliday(Market market, const std::string& local_date);
  bool IsHoliday(Market market, const std::string& local_date) const;

  MarketStatus GetStatus(Market market, common::WallClock::time_point at) const;
  MarketStatus GetCurrentStatus(Market market) const;

  // Minutes east of UTC at the given instant
  static int UtcOffsetMinutes(Market market, common::WallClock::time_point at);

  // "00700.HK" -> HK, "000001.SZ" -> SZ, "BTCUSDT" -> crypto, "AAPL" -> US
  static Market InferMarket(const std::string& symbol);

 private:
  common::WallTimeSource wall_time_source_;

  mutable std::mutex mutex_;
  std::map<Market, std::set<std::string>> holidays_;
};

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
