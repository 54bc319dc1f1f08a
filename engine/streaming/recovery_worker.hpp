#pragma once

#include "connection_supervisor.hpp"
#include "history_replay_source.hpp"
#include "rate_limiter.hpp"
#include "tick.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/common/metrics_emitter.hpp"
#include "engine/common/time_source.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mdstream {
namespace engine {
namespace streaming {

enum class RecoveryPriority { kHigh = 0, kNormal = 1, kLow = 2 };
enum class RecoveryHealth { kHealthy, kDegraded, kUnhealthy };

const char* ToString(RecoveryPriority priority);
const char* ToString(RecoveryHealth health);

struct RecoveryOptions {
  std::chrono::milliseconds max_window{300000};
  std::map<std::string, std::chrono::milliseconds> provider_max_window;
  size_t max_points_per_request = 1000;
  std::chrono::milliseconds max_gap_age{24 * 60 * 60 * 1000};
  int max_attempts = 3;
  std::chrono::milliseconds backoff_base{1000};
  std::chrono::milliseconds backoff_max{30000};
  std::chrono::milliseconds permit_timeout{5000};
  size_t replay_batch_size = 500;

  // Priority rules
  std::chrono::milliseconds high_priority_gap{30000};
  size_t low_priority_symbol_count = 50;

  // Degraded-mode batch health check
  size_t health_check_batch_size = 10;
  std::chrono::milliseconds health_check_batch_pause{100};
  std::chrono::milliseconds inactivity_threshold{60000};
  std::chrono::milliseconds quick_probe_timeout{1000};
  std::chrono::milliseconds full_probe_timeout{3000};
  int full_probe_retries = 2;

  // Failed-job thresholds for GetHealth()
  uint64_t degraded_failure_count = 100;
  uint64_t unhealthy_failure_count = 500;

  static RecoveryOptions FromConfig(const common::ConfigManager& config);

  std::chrono::milliseconds MaxWindowFor(const std::string& provider_id) const;
};

struct RecoveryJob {
  uint64_t job_id = 0;
  ConnectionId connection_id = 0;
  ConnectionKey key;
  std::set<std::string> symbols;
  int64_t last_received_ms = 0;
  int64_t detected_ms = 0;
  RecoveryPriority priority = RecoveryPriority::kNormal;
  int attempts = 0;
  common::SteadyClock::time_point not_before;
};

struct RecoveryMetrics {
  uint64_t total_jobs = 0;
  uint64_t pending_jobs = 0;
  uint64_t active_jobs = 0;
  uint64_t completed_jobs = 0;
  uint64_t failed_jobs = 0;
  uint64_t degraded_jobs = 0;
  uint64_t rejected_gaps = 0;
  uint64_t merged_gaps = 0;
  uint64_t ticks_replayed = 0;

  nlohmann::json ToJson() const;
};

struct HealthCheckReport {
  size_t total = 0;
  size_t healthy = 0;
  size_t unhealthy = 0;
  size_t quick_probes = 0;   // tier 2
  size_t full_probes = 0;    // tier 3
  size_t batches = 0;

  double HealthRate() const { return total == 0 ? 1.0 : static_cast<double>(healthy) / total; }
};

// Receives replayed ticks, sorted by timestamp and flagged recovered
using ReplaySink = std::function<void(ConnectionId connection_id, const ConnectionKey& key, const TickBatch& batch)>;

/**
 * @brief Fills data gaps reported by the supervisor from provider history
 *
 * Jobs are keyed by connection: a gap arriving while a job for the same
 * connection is still pending merges its symbols into that job. A single
 * worker thread takes the highest priority ready job, replays the recovery
 * window through HistoryReplaySource (paced by the shared RateLimiter) and
 * retries with exponential backoff. When the history backend is unavailable
 * the worker falls back to a tiered health check over all connections.
 */
class RecoveryWorker : public GapListener {
 public:
  RecoveryWorker(RecoveryOptions options,
                 std::shared_ptr<HistoryReplaySource> source,
                 SupervisorControl* supervisor,
                 RateLimiter* rate_limiter,
                 common::MetricsEmitter* metrics = nullptr,
                 common::TimeSource time_source = common::DefaultTimeSource(),
                 common::WallTimeSource wall_time_source = common::DefaultWallTimeSource());
  ~RecoveryWorker() override;

  // Non-copyable, non-movable
  RecoveryWorker(const RecoveryWorker&) = delete;
  RecoveryWorker& operator=(const RecoveryWorker&) = delete;

  // Set before Start()
  void SetReplaySink(ReplaySink sink);

  void Start();
  void Stop();
  bool IsRunning() const { return running_.load(); }

  // GapListener
  void OnGap(const GapReport& report) override;

  /** @brief Queue a recovery job; returns false if the gap is rejected */
  bool Submit(const GapReport& report);

  /** @brief Tiered batch health check over every supervised connection */
  HealthCheckReport RunHealthCheck();

  RecoveryMetrics GetMetrics() const;
  RecoveryHealth GetHealth() const;
  bool IsDegraded() const { return degraded_.load(); }

  /** @brief Wait until no job is pending or active (tests, shutdown) */
  bool WaitIdle(std::chrono::milliseconds timeout) const;

  /** @brief Window replayed for a gap detected now */
  RecoveryWindow ComputeWindow(const RecoveryJob& job) const;

  RecoveryPriority ComputePriority(int64_t last_received_ms, int64_t detected_ms, size_t symbol_count) const;

 private:
  enum class JobOutcome { kCompleted, kRetry, kExhausted, kDegraded };

  void Run();
  bool PopReadyJobLocked(std::unique_lock<std::mutex>& lock, RecoveryJob& job);
  JobOutcome Process(RecoveryJob& job);
  void Deliver(const RecoveryJob& job, TickBatch ticks);
  void OnExhausted(const RecoveryJob& job);
  std::chrono::milliseconds BackoffDelay(int attempt) const;
  bool CheckConnection(const ConnectionInfo& info, HealthCheckReport& report);
  bool PauseBetweenBatches();
  common::MetricTags Tags(const RecoveryJob& job) const;

  RecoveryOptions options_;
  std::shared_ptr<HistoryReplaySource> source_;
  SupervisorControl* supervisor_;
  RateLimiter* rate_limiter_;
  common::MetricsEmitter* metrics_;
  common::TimeSource time_source_;
  common::WallTimeSource wall_time_source_;
  ReplaySink replay_sink_;

  std::thread worker_;
  std::atomic<bool> running_{false};
  std::atomic<bool> degraded_{false};

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  mutable std::condition_variable idle_cv_;
  uint64_t next_job_id_ = 1;
  std::map<uint64_t, RecoveryJob> pending_;                    // job_id -> job
  std::unordered_map<ConnectionId, uint64_t> pending_by_conn_;
  size_t active_ = 0;
  RecoveryMetrics metrics_counters_;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
