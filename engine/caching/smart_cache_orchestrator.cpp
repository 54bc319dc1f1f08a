#include "smart_cache_orchestrator.hpp"
#include "engine/common/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace mdstream {
namespace engine {
namespace caching {

namespace {

constexpr size_t kMaxRefreshHistory = 10000;

}  // namespace

const char* ToString(ResultSource source) {
  switch (source) {
    case ResultSource::kHot: return "hot";
    case ResultSource::kWarm: return "warm";
    case ResultSource::kFetch: return "fetch";
    case ResultSource::kStale: return "stale";
  }
  return "fetch";
}

OrchestratorOptions OrchestratorOptions::FromConfig(const common::ConfigManager& config) {
  OrchestratorOptions options;
  options.refresh_ahead_ratio = std::clamp(
      config.GetDouble("cache.refresh_ahead_ratio", options.refresh_ahead_ratio), 0.0, 1.0);
  if (config.HasKey("cache.refresh_ahead_window_ms")) {
    options.refresh_ahead_window =
        config.GetMilliseconds("cache.refresh_ahead_window_ms", std::chrono::milliseconds(0));
  }
  options.min_refresh_interval =
      config.GetMilliseconds("cache.min_refresh_interval_ms", options.min_refresh_interval);
  options.refresh_retries = std::max(0, config.GetInt("cache.refresh_retries", options.refresh_retries));
  options.refresh_backoff_base =
      config.GetMilliseconds("cache.refresh_backoff_base_ms", options.refresh_backoff_base);
  options.refresh_backoff_max =
      config.GetMilliseconds("cache.refresh_backoff_max_ms", options.refresh_backoff_max);
  options.fetch_workers_min = static_cast<size_t>(
      std::max(1, config.GetInt("cache.fetch_workers_min", static_cast<int>(options.fetch_workers_min))));
  options.fetch_workers_max = static_cast<size_t>(
      std::max(1, config.GetInt("cache.fetch_workers_max", static_cast<int>(options.fetch_workers_max))));
  options.refresh_workers_min = static_cast<size_t>(
      std::max(1, config.GetInt("cache.refresh_workers_min", static_cast<int>(options.refresh_workers_min))));
  options.refresh_workers_max = static_cast<size_t>(
      std::max(1, config.GetInt("cache.refresh_workers_max", static_cast<int>(options.refresh_workers_max))));
  options.max_refresh_queue = static_cast<size_t>(
      std::max(1, config.GetInt("cache.max_refresh_queue", static_cast<int>(options.max_refresh_queue))));
  return options;
}

SmartCacheOrchestrator::SmartCacheOrchestrator(CacheTierManager& cache,
                                               OrchestratorOptions options,
                                               common::MetricsEmitter* metrics,
                                               common::WallTimeSource wall_time_source)
    : cache_(cache),
      options_(options),
      metrics_(metrics),
      wall_time_source_(std::move(wall_time_source)),
      fetch_pool_("cache_fetch",
                  common::WorkerPool::DefaultThreadCount(options.fetch_workers_min, options.fetch_workers_max)),
      refresh_pool_("cache_refresh",
                    common::WorkerPool::DefaultThreadCount(options.refresh_workers_min, options.refresh_workers_max),
                    options.max_refresh_queue) {}

SmartCacheOrchestrator::~SmartCacheOrchestrator() {
  Stop();
}

void SmartCacheOrchestrator::Start() {
  if (running_.exchange(true)) {
    return;
  }
  fetch_pool_.Start();
  refresh_pool_.Start();
  SPDLOG_INFO("SmartCacheOrchestrator: started ({} fetch workers, {} refresh workers)",
              fetch_pool_.GetThreadCount(), refresh_pool_.GetThreadCount());
}

void SmartCacheOrchestrator::Stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  stop_cv_.notify_all();

  refresh_pool_.Stop(false);
  // Waiters hold futures for queued fetches; let them resolve
  fetch_pool_.Stop(true);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshing_.clear();
  }
  SPDLOG_INFO("SmartCacheOrchestrator: stopped after {} fetches, {} refreshes",
              fetches_.load(), refreshes_.load());
}

int64_t SmartCacheOrchestrator::NowMs() const {
  return common::ToEpochMillis(wall_time_source_());
}

std::chrono::milliseconds SmartCacheOrchestrator::RefreshAheadWindow(const CacheEntry& entry,
                                                                    const GetOptions& options) const {
  if (options.refresh_ahead_window) {
    return *options.refresh_ahead_window;
  }
  if (options_.refresh_ahead_window) {
    return *options_.refresh_ahead_window;
  }
  return std::chrono::milliseconds(
      static_cast<int64_t>(static_cast<double>(entry.ttl.count()) * options_.refresh_ahead_ratio));
}

//=============================================================================
// Read path
//=============================================================================

CacheResult SmartCacheOrchestrator::GetOrCompute(const std::string& key, FetchFn fetch, const GetOptions& options) {
  if (!fetch) {
    throw std::invalid_argument("GetOrCompute requires a fetch function");
  }

  if (!options.force_refresh) {
    if (auto hit = cache_.Lookup(key)) {
      if (auto result = ResultFromHit(key, *hit, fetch, options)) {
        return *result;
      }
    }
  }

  if (!running_.load()) {
    if (auto stale = ServeStale(key, options, "stopped")) {
      return *stale;
    }
    throw common::CacheFetchError("cache orchestrator is not running");
  }

  std::optional<CacheHit> late_hit;
  auto future = GetOrStartFetch(key, fetch, options.context, !options.force_refresh, late_hit);
  if (late_hit) {
    if (auto result = ResultFromHit(key, *late_hit, fetch, options)) {
      return *result;
    }
    future = GetOrStartFetch(key, fetch, options.context, false, late_hit);
  }
  if (future.wait_for(options.timeout) != std::future_status::ready) {
    if (auto stale = ServeStale(key, options, "timeout")) {
      return *stale;
    }
    throw common::FetchTimeout("fetch for " + key + " exceeded " + std::to_string(options.timeout.count()) + "ms");
  }

  try {
    CacheResult result;
    result.value = future.get();
    result.source = ResultSource::kFetch;
    result.ttl = cache_.ComputeTtl(key, options.context);
    return result;
  } catch (const common::CacheFetchError&) {
    if (auto stale = ServeStale(key, options, "fetch_error")) {
      return *stale;
    }
    throw;
  } catch (const std::future_error& e) {
    if (auto stale = ServeStale(key, options, "fetch_error")) {
      return *stale;
    }
    throw common::CacheFetchError("fetch for " + key + " abandoned: " + e.what());
  }
}

std::optional<CacheResult> SmartCacheOrchestrator::ResultFromHit(const std::string& key, const CacheHit& hit,
                                                                 const FetchFn& fetch, const GetOptions& options) {
  try {
    CacheResult result;
    result.value = hit.entry.Value();
    result.source = hit.tier == CacheTier::kHot ? ResultSource::kHot : ResultSource::kWarm;
    result.ttl = hit.entry.Remaining(NowMs());
    if (result.ttl <= RefreshAheadWindow(hit.entry, options)) {
      ScheduleRefresh(key, fetch, options.context);
    }
    return result;
  } catch (const std::runtime_error& e) {
    SPDLOG_ERROR("SmartCacheOrchestrator: dropping undecodable entry {}: {}", key, e.what());
    cache_.Invalidate(key);
  }
  return std::nullopt;
}

std::optional<CacheResult> SmartCacheOrchestrator::ServeStale(const std::string& key, const GetOptions& options,
                                                              const char* cause) {
  if (options.stale_policy != StalePolicy::kServeStale) {
    return std::nullopt;
  }
  auto entry = cache_.GetStale(key);
  if (!entry) {
    return std::nullopt;
  }
  CacheResult result;
  try {
    result.value = entry->Value();
  } catch (const std::runtime_error& e) {
    SPDLOG_ERROR("SmartCacheOrchestrator: stale entry {} undecodable: {}", key, e.what());
    return std::nullopt;
  }
  result.stale = true;
  result.source = ResultSource::kStale;
  result.ttl = entry->Remaining(NowMs());
  common::EmitMetric(metrics_, common::metrics::kCacheStaleServed, {{"category", entry->category}, {"cause", cause}});
  SPDLOG_WARN("SmartCacheOrchestrator: serving stale {} ({})", key, cause);
  return result;
}

std::shared_future<std::string> SmartCacheOrchestrator::GetOrStartFetch(const std::string& key,
                                                                        const FetchFn& fetch,
                                                                        const MarketContext& context,
                                                                        bool recheck_cache,
                                                                        std::optional<CacheHit>& hit) {
  hit.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = in_flight_.find(key);
  if (it != in_flight_.end()) {
    return it->second;
  }
  // A fetch that finished since the caller's miss has already stored its
  // value and cleared its in-flight marker
  if (recheck_cache) {
    hit = cache_.Lookup(key);
    if (hit) {
      return {};
    }
  }

  auto promise = std::make_shared<std::promise<std::string>>();
  std::shared_future<std::string> future = promise->get_future().share();
  in_flight_.emplace(key, future);
  fetches_.fetch_add(1, std::memory_order_relaxed);

  const bool submitted = fetch_pool_.Submit([this, key, fetch, context, promise] {
    try {
      std::string value = fetch();
      cache_.Set(key, value, context);
      {
        std::lock_guard<std::mutex> guard(mutex_);
        in_flight_.erase(key);
      }
      promise->set_value(std::move(value));
    } catch (const std::exception& e) {
      SPDLOG_WARN("SmartCacheOrchestrator: fetch for {} failed: {}", key, e.what());
      common::EmitMetric(metrics_, common::metrics::kCacheFetchError,
                         {{"category", CategoryOf(key)}, {"path", "foreground"}});
      {
        std::lock_guard<std::mutex> guard(mutex_);
        in_flight_.erase(key);
      }
      promise->set_exception(std::make_exception_ptr(
          common::CacheFetchError("fetch for " + key + " failed: " + e.what())));
    }
  });

  if (!submitted) {
    in_flight_.erase(key);
    promise->set_exception(std::make_exception_ptr(
        common::CacheFetchError("fetch pool rejected " + key)));
  }
  return future;
}

//=============================================================================
// Refresh-ahead
//=============================================================================

bool SmartCacheOrchestrator::ScheduleRefresh(const std::string& key, const FetchFn& fetch,
                                             const MarketContext& context) {
  if (!running_.load()) {
    return false;
  }
  const int64_t now_ms = NowMs();

  std::lock_guard<std::mutex> lock(mutex_);
  if (refreshing_.count(key) > 0) {
    return false;
  }
  auto last = last_refresh_ms_.find(key);
  if (last != last_refresh_ms_.end() && now_ms - last->second < options_.min_refresh_interval.count()) {
    SPDLOG_DEBUG("SmartCacheOrchestrator: refresh for {} throttled", key);
    return false;
  }

  if (last_refresh_ms_.size() >= kMaxRefreshHistory) {
    for (auto it = last_refresh_ms_.begin(); it != last_refresh_ms_.end();) {
      if (now_ms - it->second >= options_.min_refresh_interval.count()) {
        it = last_refresh_ms_.erase(it);
      } else {
        ++it;
      }
    }
  }

  refreshing_.insert(key);
  last_refresh_ms_[key] = now_ms;
  if (!refresh_pool_.Submit([this, key, fetch, context] { RunRefresh(key, fetch, context); })) {
    refreshing_.erase(key);
    return false;
  }
  SPDLOG_DEBUG("SmartCacheOrchestrator: refresh-ahead scheduled for {}", key);
  return true;
}

std::chrono::milliseconds SmartCacheOrchestrator::RefreshBackoff(int attempt) const {
  const int64_t base = options_.refresh_backoff_base.count();
  const int64_t cap = options_.refresh_backoff_max.count();
  int64_t delay = base;
  for (int i = 1; i < attempt && delay < cap; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, cap));
}

void SmartCacheOrchestrator::RunRefresh(const std::string& key, const FetchFn& fetch,
                                        const MarketContext& context) {
  bool refreshed = false;
  for (int attempt = 0; attempt <= options_.refresh_retries && running_.load(); ++attempt) {
    if (attempt > 0) {
      std::unique_lock<std::mutex> lock(stop_mutex_);
      if (stop_cv_.wait_for(lock, RefreshBackoff(attempt), [this] { return !running_.load(); })) {
        break;
      }
    }
    try {
      cache_.Set(key, fetch(), context);
      refreshed = true;
      refreshes_.fetch_add(1, std::memory_order_relaxed);
      common::EmitMetric(metrics_, common::metrics::kCacheRefresh,
                         {{"category", CategoryOf(key)}, {"attempts", std::to_string(attempt + 1)}});
      break;
    } catch (const std::exception& e) {
      SPDLOG_WARN("SmartCacheOrchestrator: refresh {} attempt {} failed: {}", key, attempt + 1, e.what());
    }
  }

  if (!refreshed) {
    common::EmitMetric(metrics_, common::metrics::kCacheFetchError,
                       {{"category", CategoryOf(key)}, {"path", "refresh"}});
  }
  std::lock_guard<std::mutex> lock(mutex_);
  refreshing_.erase(key);
}

size_t SmartCacheOrchestrator::GetInFlightCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_.size();
}

size_t SmartCacheOrchestrator::GetRefreshingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return refreshing_.size();
}

bool SmartCacheOrchestrator::WaitIdle(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  if (!fetch_pool_.WaitIdle(timeout)) {
    return false;
  }
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return refresh_pool_.WaitIdle(std::max(remaining, std::chrono::milliseconds(0)));
}

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
