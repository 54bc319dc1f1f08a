#pragma once

#include "cache_entry.hpp"
#include "cache_tier_manager.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/common/metrics_emitter.hpp"
#include "engine/common/time_source.hpp"
#include "engine/common/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace mdstream {
namespace engine {
namespace caching {

enum class StalePolicy { kNever, kServeStale };
enum class ResultSource { kHot, kWarm, kFetch, kStale };

const char* ToString(ResultSource source);

// May run on a refresh worker after GetOrCompute() returned; must own
// everything it captures.
using FetchFn = std::function<std::string()>;

struct GetOptions {
  MarketContext context;
  std::chrono::milliseconds timeout{5000};
  // Overrides the orchestrator-wide refresh-ahead window for this call
  std::optional<std::chrono::milliseconds> refresh_ahead_window;
  StalePolicy stale_policy = StalePolicy::kServeStale;
  bool force_refresh = false;
};

struct CacheResult {
  std::string value;
  bool stale = false;
  ResultSource source = ResultSource::kFetch;
  std::chrono::milliseconds ttl{0};  // remaining freshness
};

struct OrchestratorOptions {
  // Refresh when remaining TTL <= ttl * ratio, unless a fixed window is set
  double refresh_ahead_ratio = 0.25;
  std::optional<std::chrono::milliseconds> refresh_ahead_window;
  std::chrono::milliseconds min_refresh_interval{1000};
  int refresh_retries = 3;
  std::chrono::milliseconds refresh_backoff_base{100};
  std::chrono::milliseconds refresh_backoff_max{5000};
  size_t fetch_workers_min = 2;
  size_t fetch_workers_max = 16;
  size_t refresh_workers_min = 1;
  size_t refresh_workers_max = 4;
  size_t max_refresh_queue = 1000;

  // cache.*
  static OrchestratorOptions FromConfig(const common::ConfigManager& config);
};

/**
 * @brief Read-through cache on top of CacheTierManager
 *
 * Concurrent misses on one key share a single upstream fetch. Hits close
 * to expiry return immediately and schedule one background refresh per
 * key. Failed fetches are never cached.
 */
class SmartCacheOrchestrator {
 public:
  SmartCacheOrchestrator(CacheTierManager& cache,
                         OrchestratorOptions options = OrchestratorOptions(),
                         common::MetricsEmitter* metrics = nullptr,
                         common::WallTimeSource wall_time_source = common::DefaultWallTimeSource());
  ~SmartCacheOrchestrator();

  // Non-copyable, non-movable
  SmartCacheOrchestrator(const SmartCacheOrchestrator&) = delete;
  SmartCacheOrchestrator& operator=(const SmartCacheOrchestrator&) = delete;

  void Start();
  // Pending refreshes are dropped; in-flight fetches complete
  void Stop();
  bool IsRunning() const { return running_.load(); }

  /**
   * @brief Cached value or the result of one shared fetch
   *
   * Throws CacheFetchError when the fetch fails and FetchTimeout when it
   * outlives options.timeout, unless the stale policy allows a stale value.
   */
  CacheResult GetOrCompute(const std::string& key, FetchFn fetch, const GetOptions& options = GetOptions());

  std::chrono::milliseconds RefreshAheadWindow(const CacheEntry& entry, const GetOptions& options) const;

  size_t GetInFlightCount() const;
  size_t GetRefreshingCount() const;
  uint64_t GetFetchCount() const { return fetches_.load(); }
  uint64_t GetRefreshCount() const { return refreshes_.load(); }

  // Both pools idle
  bool WaitIdle(std::chrono::milliseconds timeout);

 private:
  // Leaves `hit` set and returns an empty future when a recheck finds the key cached
  std::shared_future<std::string> GetOrStartFetch(const std::string& key, const FetchFn& fetch,
                                                  const MarketContext& context, bool recheck_cache,
                                                  std::optional<CacheHit>& hit);
  std::optional<CacheResult> ResultFromHit(const std::string& key, const CacheHit& hit, const FetchFn& fetch,
                                           const GetOptions& options);
  bool ScheduleRefresh(const std::string& key, const FetchFn& fetch, const MarketContext& context);
  void RunRefresh(const std::string& key, const FetchFn& fetch, const MarketContext& context);
  std::optional<CacheResult> ServeStale(const std::string& key, const GetOptions& options, const char* cause);
  std::chrono::milliseconds RefreshBackoff(int attempt) const;
  int64_t NowMs() const;

  CacheTierManager& cache_;
  OrchestratorOptions options_;
  common::MetricsEmitter* metrics_;
  common::WallTimeSource wall_time_source_;

  common::WorkerPool fetch_pool_;
  common::WorkerPool refresh_pool_;
  std::atomic<bool> running_{false};

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_future<std::string>> in_flight_;
  std::unordered_set<std::string> refreshing_;
  std::unordered_map<std::string, int64_t> last_refresh_ms_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::atomic<uint64_t> fetches_{0};
  std::atomic<uint64_t> refreshes_{0};
};

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
