#pragma once

#include "cache_entry.hpp"
#include "compression.hpp"
#include "hot_tier.hpp"
#include "market_session.hpp"
#include "ttl_policy.hpp"
#include "warm_store.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/common/metrics_emitter.hpp"
#include "engine/common/time_source.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace mdstream {
namespace engine {
namespace caching {

enum class CacheTier { kHot, kWarm };

const char* ToString(CacheTier tier);

struct CacheTierOptions {
  size_t hot_capacity = 100000;
  size_t max_category_index_size = 10000;
  // How long an expired entry stays available to GetStale()
  std::chrono::milliseconds stale_retention{3600000};
  std::chrono::milliseconds min_hot_ttl{1000};
  std::chrono::milliseconds min_warm_ttl{5000};
  CompressionOptions compression;

  // cache.*
  static CacheTierOptions FromConfig(const common::ConfigManager& config);
};

struct CacheHit {
  CacheEntry entry;
  CacheTier tier = CacheTier::kHot;
};

struct CacheStats {
  uint64_t hot_hits = 0;
  uint64_t warm_hits = 0;
  uint64_t misses = 0;
  uint64_t stale_hits = 0;
  uint64_t sets = 0;
  uint64_t compressed_sets = 0;
  uint64_t compression_failures = 0;  // stored uncompressed above the threshold
  uint64_t invalidations = 0;
  uint64_t warm_errors = 0;
  uint64_t evictions = 0;
  uint64_t index_fallbacks = 0;
  size_t hot_size = 0;

  nlohmann::json ToJson() const;
};

/**
 * @brief Two-tier cache: in-process LRU in front of an optional WarmStore
 *
 * TTLs come from the market status of the entry's context. Warm hits are
 * promoted into the hot tier. Warm store failures are logged and counted;
 * they never reach the caller.
 */
class CacheTierManager {
 public:
  CacheTierManager(CacheTierOptions options,
                   std::shared_ptr<WarmStore> warm_store,
                   std::shared_ptr<MarketSessionCalendar> calendar,
                   TtlPolicy ttl_policy = TtlPolicy(),
                   common::MetricsEmitter* metrics = nullptr,
                   common::WallTimeSource wall_time_source = common::DefaultWallTimeSource());

  // Non-copyable, non-movable
  CacheTierManager(const CacheTierManager&) = delete;
  CacheTierManager& operator=(const CacheTierManager&) = delete;

  // Fresh entries only
  std::optional<CacheHit> Lookup(const std::string& key);
  std::optional<CacheEntry> Get(const std::string& key);

  // Expired entries still inside stale_retention; fresh entries too
  std::optional<CacheEntry> GetStale(const std::string& key);

  // A payload above the profile threshold is stored compressed; if zlib
  // fails it is stored as-is and counted in compression_failures
  CacheEntry Set(const std::string& key, const std::string& value, const MarketContext& context);

  /**
   * @brief Removes matching entries from both tiers
   *
   * "quote:*" invalidates the quote category through the index,
   * "quote:AA*" scans by prefix, anything else is an exact key.
   * Returns the number of entries removed across both tiers.
   */
  size_t Invalidate(const std::string& pattern);

  std::chrono::milliseconds ComputeTtl(const std::string& key, const MarketContext& context) const;
  MarketStatus ResolveStatus(const std::string& key, const MarketContext& context) const;

  CacheStats GetStats() const;
  int64_t NowMs() const;

 private:
  std::chrono::milliseconds TtlFor(MarketStatus status, const MarketContext& context) const;
  size_t InvalidateWarmPrefix(const std::string& prefix);
  void WarmSet(const CacheEntry& entry, std::chrono::milliseconds ttl);
  std::optional<CacheEntry> WarmGet(const std::string& key);
  bool WarmDelete(const std::string& key);

  CacheTierOptions options_;
  std::shared_ptr<WarmStore> warm_store_;
  std::shared_ptr<MarketSessionCalendar> calendar_;
  TtlPolicy ttl_policy_;
  CompressionPolicy compression_;
  common::MetricsEmitter* metrics_;
  common::WallTimeSource wall_time_source_;

  HotTier hot_;

  std::atomic<uint64_t> hot_hits_{0};
  std::atomic<uint64_t> warm_hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> stale_hits_{0};
  std::atomic<uint64_t> sets_{0};
  std::atomic<uint64_t> compressed_sets_{0};
  std::atomic<uint64_t> compression_failures_{0};
  std::atomic<uint64_t> invalidations_{0};
  std::atomic<uint64_t> warm_errors_{0};
};

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
