#pragma once

#include "market_session.hpp"
#include "engine/common/config_manager.hpp"

#include <chrono>
#include <map>
#include <utility>

namespace mdstream {
namespace engine {
namespace caching {

// Realtime data (quotes, depth) wants short TTLs while a market trades;
// analytical data (fundamentals, aggregates) tolerates longer ones.
enum class DataKind { kRealtime, kAnalytical };

const char* ToString(DataKind kind);

/**
 * @brief TTL table keyed by market status and data kind
 *
 * Defaults (seconds):
 *   status         realtime  analytical
 *   TRADING             5         60
 *   PRE_MARKET         15        300
 *   AFTER_HOURS        15        600
 *   LUNCH_BREAK        60        900
 *   MARKET_CLOSED    3600       3600
 *   WEEKEND          7200       7200
 *   HOLIDAY         14400      14400
 */
class TtlPolicy {
 public:
  TtlPolicy();

  // cache.ttl.<realtime|analytical>.<STATUS>_s overrides single cells
  static TtlPolicy FromConfig(const common::ConfigManager& config);

  std::chrono::seconds GetTtl(MarketStatus status, DataKind kind) const;
  void SetTtl(MarketStatus status, DataKind kind, std::chrono::seconds ttl);

 private:
  std::map<std::pair<MarketStatus, DataKind>, std::chrono::seconds> table_;
};

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
