#pragma once

#include "engine/common/config_manager.hpp"
#include "engine/common/metrics_emitter.hpp"
#include "engine/common/time_source.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace mdstream {
namespace engine {
namespace streaming {

// Per-provider QPS ceiling
struct RateLimitBudget {
  // Positive rates below this are raised to it; 0 disables refill
  static constexpr double kMinQps = 0.001;

  double max_qps = 10.0;
  double burst_size = 20.0;

  // Clamps to burst >= 1 and max_qps of 0 or >= kMinQps
  RateLimitBudget Sanitized() const;
};

struct AcquireResult {
  enum class Status { kPermit, kTimeout };

  Status status = Status::kTimeout;
  std::chrono::milliseconds waited{0};

  bool IsPermit() const { return status == Status::kPermit; }
};

struct RateLimiterStats {
  uint64_t allowed = 0;
  uint64_t denied = 0;
  double available_tokens = 0.0;
};

// Token bucket rate limiter, one bucket per provider
//
// Capacity is the burst size, refill is max_qps tokens per second with
// fractional accumulation. Live subscription traffic and recovery replays draw
// from the same bucket. Exceeding the budget never throws.
class RateLimiter {
 public:
  explicit RateLimiter(RateLimitBudget default_budget = {},
                       common::TimeSource time_source = common::DefaultTimeSource(),
                       common::MetricsEmitter* metrics = nullptr);
  ~RateLimiter() = default;

  // Non-copyable, non-movable
  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // Reads rate_limits.default and rate_limits.providers.<id>
  void LoadFromConfig(const common::ConfigManager& config);

  // Install or replace a provider budget; the bucket starts full
  void ConfigureProvider(const std::string& provider_id, RateLimitBudget budget);

  // Take one token if available (non-blocking)
  bool TryAcquire(const std::string& provider_id);

  // Wait up to timeout for a token; sleeps without holding any lock
  AcquireResult AcquireBlocking(const std::string& provider_id, std::chrono::milliseconds timeout);

  RateLimitBudget GetBudget(const std::string& provider_id) const;
  RateLimiterStats GetStats(const std::string& provider_id) const;

 private:
  struct Bucket {
    RateLimitBudget budget;
    double tokens = 0.0;
    common::SteadyClock::time_point last_refill;
    uint64_t allowed = 0;
    uint64_t denied = 0;
    std::mutex mutex;
  };

  std::shared_ptr<Bucket> GetBucket(const std::string& provider_id);
  std::shared_ptr<Bucket> FindBucket(const std::string& provider_id) const;
  void Refill(Bucket& bucket, common::SteadyClock::time_point now);
  // Consume a token or return how long until one is available
  bool TryConsume(Bucket& bucket, std::chrono::nanoseconds& wait_hint, bool count_denial);

  RateLimitBudget default_budget_;
  common::TimeSource time_source_;
  common::MetricsEmitter* metrics_;

  // Bucket map lock; each bucket carries its own lock
  mutable std::shared_mutex buckets_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Bucket>> buckets_;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
