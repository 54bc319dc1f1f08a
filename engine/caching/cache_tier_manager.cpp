#include "cache_tier_manager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace mdstream {
namespace engine {
namespace caching {

const char* ToString(CacheTier tier) {
  return tier == CacheTier::kHot ? "hot" : "warm";
}

CacheTierOptions CacheTierOptions::FromConfig(const common::ConfigManager& config) {
  CacheTierOptions options;
  options.hot_capacity = static_cast<size_t>(std::max<int64_t>(
      1, config.GetInt64("cache.hot_capacity", static_cast<int64_t>(options.hot_capacity))));
  options.max_category_index_size = static_cast<size_t>(std::max<int64_t>(
      1, config.GetInt64("cache.max_category_index_size",
                         static_cast<int64_t>(options.max_category_index_size))));
  options.stale_retention = config.GetMilliseconds("cache.stale_retention_ms", options.stale_retention);
  options.min_hot_ttl = config.GetMilliseconds("cache.min_hot_ttl_ms", options.min_hot_ttl);
  options.min_warm_ttl = config.GetMilliseconds("cache.min_warm_ttl_ms", options.min_warm_ttl);
  options.compression = CompressionOptions::FromConfig(config);
  return options;
}

nlohmann::json CacheStats::ToJson() const {
  return nlohmann::json{
      {"hot_hits", hot_hits},
      {"warm_hits", warm_hits},
      {"misses", misses},
      {"stale_hits", stale_hits},
      {"sets", sets},
      {"compressed_sets", compressed_sets},
      {"compression_failures", compression_failures},
      {"invalidations", invalidations},
      {"warm_errors", warm_errors},
      {"evictions", evictions},
      {"index_fallbacks", index_fallbacks},
      {"hot_size", hot_size}};
}

CacheTierManager::CacheTierManager(CacheTierOptions options,
                                   std::shared_ptr<WarmStore> warm_store,
                                   std::shared_ptr<MarketSessionCalendar> calendar,
                                   TtlPolicy ttl_policy,
                                   common::MetricsEmitter* metrics,
                                   common::WallTimeSource wall_time_source)
    : options_(options),
      warm_store_(std::move(warm_store)),
      calendar_(std::move(calendar)),
      ttl_policy_(std::move(ttl_policy)),
      compression_(options.compression),
      metrics_(metrics),
      wall_time_source_(std::move(wall_time_source)),
      hot_(options.hot_capacity, options.max_category_index_size) {
  if (!calendar_) {
    throw std::invalid_argument("CacheTierManager requires a market session calendar");
  }
  SPDLOG_INFO("CacheTierManager: hot capacity {}, warm tier {}", options_.hot_capacity,
              warm_store_ ? "enabled" : "disabled");
}

int64_t CacheTierManager::NowMs() const {
  return common::ToEpochMillis(wall_time_source_());
}

//=============================================================================
// Reads
//=============================================================================

std::optional<CacheHit> CacheTierManager::Lookup(const std::string& key) {
  const int64_t now_ms = NowMs();

  if (auto entry = hot_.Get(key)) {
    if (!entry->IsExpired(now_ms)) {
      hot_hits_.fetch_add(1, std::memory_order_relaxed);
      common::EmitMetric(metrics_, common::metrics::kCacheHit, {{"tier", "hot"}, {"category", entry->category}});
      return CacheHit{std::move(*entry), CacheTier::kHot};
    }
    if (now_ms >= entry->expires_ms + options_.stale_retention.count()) {
      hot_.Erase(key);
    }
  }

  if (auto entry = WarmGet(key)) {
    if (!entry->IsExpired(now_ms)) {
      hot_.Put(*entry);
      warm_hits_.fetch_add(1, std::memory_order_relaxed);
      common::EmitMetric(metrics_, common::metrics::kCacheHit, {{"tier", "warm"}, {"category", entry->category}});
      return CacheHit{std::move(*entry), CacheTier::kWarm};
    }
  }

  misses_.fetch_add(1, std::memory_order_relaxed);
  common::EmitMetric(metrics_, common::metrics::kCacheMiss, {{"category", CategoryOf(key)}});
  return std::nullopt;
}

std::optional<CacheEntry> CacheTierManager::Get(const std::string& key) {
  auto hit = Lookup(key);
  if (!hit) {
    return std::nullopt;
  }
  return std::move(hit->entry);
}

std::optional<CacheEntry> CacheTierManager::GetStale(const std::string& key) {
  const int64_t now_ms = NowMs();
  const int64_t retention_ms = options_.stale_retention.count();

  std::optional<CacheEntry> best = hot_.Get(key);
  if (auto warm = WarmGet(key)) {
    if (!best || warm->expires_ms > best->expires_ms) {
      best = std::move(warm);
    }
  }
  if (!best || now_ms >= best->expires_ms + retention_ms) {
    return std::nullopt;
  }
  stale_hits_.fetch_add(1, std::memory_order_relaxed);
  return best;
}

//=============================================================================
// Writes
//=============================================================================

MarketStatus CacheTierManager::ResolveStatus(const std::string& key, const MarketContext& context) const {
  if (context.status) {
    return *context.status;
  }
  Market market = Market::kUnknown;
  if (context.market) {
    market = *context.market;
  } else {
    const auto pos = key.rfind(':');
    const std::string symbol = !context.symbol.empty() ? context.symbol
                               : pos == std::string::npos ? key
                                                          : key.substr(pos + 1);
    market = MarketSessionCalendar::InferMarket(symbol);
  }
  return calendar_->GetCurrentStatus(market);
}

std::chrono::milliseconds CacheTierManager::TtlFor(MarketStatus status, const MarketContext& context) const {
  if (context.ttl_override) {
    return *context.ttl_override;
  }
  return ttl_policy_.GetTtl(status, context.kind);
}

std::chrono::milliseconds CacheTierManager::ComputeTtl(const std::string& key, const MarketContext& context) const {
  return TtlFor(ResolveStatus(key, context), context);
}

CacheEntry CacheTierManager::Set(const std::string& key, const std::string& value, const MarketContext& context) {
  const int64_t now_ms = NowMs();
  const MarketStatus status = ResolveStatus(key, context);
  const auto ttl = TtlFor(status, context);
  const auto hot_ttl = std::max(ttl, options_.min_hot_ttl);
  const auto warm_ttl = std::max(ttl, options_.min_warm_ttl);

  CacheEntry entry;
  entry.key = key;
  entry.category = context.category.empty() ? CategoryOf(key) : context.category;
  entry.status = status;
  entry.original_size = value.size();
  entry.created_ms = now_ms;
  entry.ttl = hot_ttl;
  entry.expires_ms = now_ms + hot_ttl.count();

  if (compression_.ShouldCompress(value.size(), context.profile)) {
    try {
      entry.data = compression_.Compress(value);
      entry.compressed = true;
      compressed_sets_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
      SPDLOG_ERROR("CacheTierManager: compression failed, storing {} uncompressed: {}", key, e.what());
      compression_failures_.fetch_add(1, std::memory_order_relaxed);
      common::EmitMetric(metrics_, common::metrics::kCacheCompressionFailed, {{"category", entry.category}});
      entry.data = value;
    }
  } else {
    entry.data = value;
  }

  hot_.Put(entry);
  sets_.fetch_add(1, std::memory_order_relaxed);

  CacheEntry warm_entry = entry;
  warm_entry.ttl = warm_ttl;
  warm_entry.expires_ms = now_ms + warm_ttl.count();
  WarmSet(warm_entry, warm_ttl + options_.stale_retention);

  SPDLOG_DEBUG("CacheTierManager: set {} ({} bytes{}, ttl {}ms, {})", key, value.size(),
               entry.compressed ? " compressed" : "", hot_ttl.count(), ToString(entry.status));
  return entry;
}

size_t CacheTierManager::Invalidate(const std::string& pattern) {
  if (pattern.empty()) {
    return 0;
  }
  size_t removed = 0;
  if (pattern.size() > 2 && pattern.compare(pattern.size() - 2, 2, ":*") == 0) {
    const std::string category = pattern.substr(0, pattern.size() - 2);
    removed += hot_.EraseCategory(category);
    removed += InvalidateWarmPrefix(category + ":");
  } else if (pattern.back() == '*') {
    const std::string prefix = pattern.substr(0, pattern.size() - 1);
    removed += hot_.ErasePrefix(prefix);
    removed += InvalidateWarmPrefix(prefix);
  } else {
    removed += hot_.Erase(pattern) ? 1 : 0;
    removed += WarmDelete(pattern) ? 1 : 0;
  }
  invalidations_.fetch_add(1, std::memory_order_relaxed);
  SPDLOG_INFO("CacheTierManager: invalidated {} ({} entries)", pattern, removed);
  return removed;
}

CacheStats CacheTierManager::GetStats() const {
  CacheStats stats;
  stats.hot_hits = hot_hits_.load();
  stats.warm_hits = warm_hits_.load();
  stats.misses = misses_.load();
  stats.stale_hits = stale_hits_.load();
  stats.sets = sets_.load();
  stats.compressed_sets = compressed_sets_.load();
  stats.compression_failures = compression_failures_.load();
  stats.invalidations = invalidations_.load();
  stats.warm_errors = warm_errors_.load();
  stats.evictions = hot_.GetEvictions();
  stats.index_fallbacks = hot_.GetIndexFallbacks();
  stats.hot_size = hot_.Size();
  return stats;
}

//=============================================================================
// Warm tier; failures are absorbed here
//=============================================================================

size_t CacheTierManager::InvalidateWarmPrefix(const std::string& prefix) {
  if (!warm_store_) {
    return 0;
  }
  std::vector<std::string> keys;
  try {
    keys = warm_store_->ScanPrefix(prefix);
  } catch (const std::exception& e) {
    warm_errors_.fetch_add(1, std::memory_order_relaxed);
    SPDLOG_WARN("CacheTierManager: warm scan for {} failed: {}", prefix, e.what());
    return 0;
  }
  size_t removed = 0;
  for (const auto& key : keys) {
    removed += WarmDelete(key) ? 1 : 0;
  }
  return removed;
}

void CacheTierManager::WarmSet(const CacheEntry& entry, std::chrono::milliseconds ttl) {
  if (!warm_store_) {
    return;
  }
  try {
    warm_store_->Set(entry, ttl);
  } catch (const std::exception& e) {
    warm_errors_.fetch_add(1, std::memory_order_relaxed);
    SPDLOG_WARN("CacheTierManager: warm set for {} failed: {}", entry.key, e.what());
  }
}

std::optional<CacheEntry> CacheTierManager::WarmGet(const std::string& key) {
  if (!warm_store_) {
    return std::nullopt;
  }
  try {
    return warm_store_->Get(key);
  } catch (const std::exception& e) {
    warm_errors_.fetch_add(1, std::memory_order_relaxed);
    SPDLOG_WARN("CacheTierManager: warm get for {} failed: {}", key, e.what());
    return std::nullopt;
  }
}

bool CacheTierManager::WarmDelete(const std::string& key) {
  if (!warm_store_) {
    return false;
  }
  try {
    return warm_store_->Delete(key);
  } catch (const std::exception& e) {
    warm_errors_.fetch_add(1, std::memory_order_relaxed);
    SPDLOG_WARN("CacheTierManager: warm delete for {} failed: {}", key, e.what());
    return false;
  }
}

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
