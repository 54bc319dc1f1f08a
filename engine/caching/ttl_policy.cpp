#include "ttl_policy.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace mdstream {
namespace engine {
namespace caching {

namespace {

constexpr MarketStatus kAllStatuses[] = {
    MarketStatus::kMarketClosed, MarketStatus::kPreMarket, MarketStatus::kTrading,
    MarketStatus::kLunchBreak,   MarketStatus::kAfterHours, MarketStatus::kHoliday,
    MarketStatus::kWeekend};

}  // namespace

const char* ToString(DataKind kind) {
  return kind == DataKind::kRealtime ? "realtime" : "analytical";
}

TtlPolicy::TtlPolicy() {
  using std::chrono::seconds;
  const struct {
    MarketStatus status;
    int64_t realtime_s;
    int64_t analytical_s;
  } kDefaults[] = {
      {MarketStatus::kTrading, 5, 60},
      {MarketStatus::kPreMarket, 15, 300},
      {MarketStatus::kAfterHours, 15, 600},
      {MarketStatus::kLunchBreak, 60, 900},
      {MarketStatus::kMarketClosed, 3600, 3600},
      {MarketStatus::kWeekend, 7200, 7200},
      {MarketStatus::kHoliday, 14400, 14400}};

  for (const auto& row : kDefaults) {
    table_[{row.status, DataKind::kRealtime}] = seconds(row.realtime_s);
    table_[{row.status, DataKind::kAnalytical}] = seconds(row.analytical_s);
  }
}

TtlPolicy TtlPolicy::FromConfig(const common::ConfigManager& config) {
  TtlPolicy policy;
  int overrides = 0;
  for (DataKind kind : {DataKind::kRealtime, DataKind::kAnalytical}) {
    for (MarketStatus status : kAllStatuses) {
      const std::string key = std::string("cache.ttl.") + ToString(kind) + "." + ToString(status) + "_s";
      if (!config.HasKey(key)) {
        continue;
      }
      const int64_t value = config.GetInt64(key, 0);
      if (value <= 0) {
        SPDLOG_WARN("TtlPolicy: ignoring non-positive TTL {}={}", key, value);
        continue;
      }
      policy.SetTtl(status, kind, std::chrono::seconds(value));
      ++overrides;
    }
  }
  if (overrides > 0) {
    SPDLOG_INFO("TtlPolicy: applied {} TTL overrides", overrides);
  }
  return policy;
}

std::chrono::seconds TtlPolicy::GetTtl(MarketStatus status, DataKind kind) const {
  auto it = table_.find({status, kind});
  if (it == table_.end()) {
    return table_.at({MarketStatus::kMarketClosed, kind});
  }
  return it->second;
}

void TtlPolicy::SetTtl(MarketStatus status, DataKind kind, std::chrono::seconds ttl) {
  table_[{status, kind}] = ttl;
}

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
