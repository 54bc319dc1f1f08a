#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace mdstream {
namespace engine {
namespace common {

using MetricTags = std::map<std::string, std::string>;

// Event names shared by all components
namespace metrics {
constexpr const char* kConnectionStateTransition = "connection.state_transition";
constexpr const char* kConnectionReleased = "connection.released";
constexpr const char* kRecoveryAttempt = "recovery.attempt";
constexpr const char* kRecoveryCompleted = "recovery.completed";
constexpr const char* kRecoveryFailed = "recovery.failed";
constexpr const char* kRecoveryDegraded = "recovery.degraded";
constexpr const char* kHealthCheckBatch = "health_check.batch";
constexpr const char* kCacheHit = "cache.hit";
constexpr const char* kCacheMiss = "cache.miss";
constexpr const char* kCacheRefresh = "cache.refresh";
constexpr const char* kCacheStaleServed = "cache.stale_served";
constexpr const char* kCacheFetchError = "cache.fetch_error";
constexpr const char* kCacheCompressionFailed = "cache.compression_failed";
constexpr const char* kRateLimitRejected = "rate_limit.rejected";
constexpr const char* kFeatureFlagConflict = "feature_flags.conflict";
constexpr const char* kFeatureFlagEmergencyOverride = "feature_flags.emergency_override";
constexpr const char* kFeatureFlagAutoRollback = "feature_flags.auto_rollback";
constexpr const char* kGatewayError = "broadcast.gateway_error";
}  // namespace metrics

/**
 * @brief Sink for metrics and lifecycle events
 *
 * Consumed by an external monitoring collector. Implementations must be
 * thread-safe; Emit() is called from IO, timer and worker threads.
 */
class MetricsEmitter {
 public:
  virtual ~MetricsEmitter() = default;

  virtual void Emit(const std::string& name, const MetricTags& tags, double value = 1.0) = 0;
};

/**
 * @brief In-process emitter aggregating counters by event name
 *
 * Keeps a bounded tail of recent events for inspection (admin endpoint, tests).
 */
class CountingMetricsEmitter : public MetricsEmitter {
 public:
  struct Event {
    std::string name;
    MetricTags tags;
    double value = 1.0;
  };

  explicit CountingMetricsEmitter(size_t max_recent_events = 1024);

  void Emit(const std::string& name, const MetricTags& tags, double value = 1.0) override;

  /** @brief Sum of values emitted under name */
  double GetCount(const std::string& name) const;

  /** @brief Recent events matching name (all names if empty) */
  std::vector<Event> GetRecentEvents(const std::string& name = "") const;

  /** @brief Counter snapshot as JSON object */
  nlohmann::json Snapshot() const;

  void Reset();

 private:
  size_t max_recent_events_;
  std::map<std::string, double> counters_;
  std::vector<Event> recent_events_;
  mutable std::mutex mutex_;
};

// Null-safe helper used by components holding an optional emitter
inline void EmitMetric(MetricsEmitter* emitter, const std::string& name,
                       const MetricTags& tags = {}, double value = 1.0) {
  if (emitter) {
    emitter->Emit(name, tags, value);
  }
}

}  // namespace common
}  // namespace engine
}  // namespace mdstream
