#include "rate_limiter.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace mdstream {
namespace engine {
namespace streaming {

namespace {

// Longest refill wait reported to AcquireBlocking
constexpr std::chrono::hours kMaxWaitHint{1};

RateLimitBudget ReadBudget(const common::ConfigManager& config, const std::string& prefix,
                           const RateLimitBudget& fallback) {
  RateLimitBudget budget;
  budget.max_qps = config.GetDouble(prefix + ".max_qps", fallback.max_qps);
  budget.burst_size = config.GetDouble(prefix + ".burst_size", fallback.burst_size);
  return budget.Sanitized();
}

}  // namespace

RateLimitBudget RateLimitBudget::Sanitized() const {
  RateLimitBudget budget = *this;
  if (!(budget.max_qps > 0.0)) {
    budget.max_qps = 0.0;
  } else if (budget.max_qps < kMinQps) {
    budget.max_qps = kMinQps;
  }
  if (!(budget.burst_size >= 1.0)) {
    budget.burst_size = 1.0;
  }
  return budget;
}

RateLimiter::RateLimiter(RateLimitBudget default_budget,
                         common::TimeSource time_source,
                         common::MetricsEmitter* metrics)
    : default_budget_(default_budget.Sanitized()),
      time_source_(std::move(time_source)),
      metrics_(metrics) {}

void RateLimiter::LoadFromConfig(const common::ConfigManager& config) {
  {
    std::unique_lock<std::shared_mutex> lock(buckets_mutex_);
    default_budget_ = ReadBudget(config, "rate_limits.default", default_budget_);
  }
  for (const auto& provider_id : config.GetObjectKeys("rate_limits.providers")) {
    ConfigureProvider(provider_id,
                      ReadBudget(config, "rate_limits.providers." + provider_id, default_budget_));
  }
  SPDLOG_INFO("RateLimiter: default budget {} qps / burst {}",
              default_budget_.max_qps, default_budget_.burst_size);
}

void RateLimiter::ConfigureProvider(const std::string& provider_id, RateLimitBudget budget) {
  const RateLimitBudget sanitized = budget.Sanitized();
  if (sanitized.max_qps != budget.max_qps || sanitized.burst_size != budget.burst_size) {
    SPDLOG_WARN("RateLimiter: invalid budget for {} ({} qps, burst {}), clamping to {} qps, burst {}",
                provider_id, budget.max_qps, budget.burst_size, sanitized.max_qps, sanitized.burst_size);
    budget = sanitized;
  }

  auto bucket = std::make_shared<Bucket>();
  bucket->budget = budget;
  bucket->tokens = budget.burst_size;
  bucket->last_refill = time_source_();

  std::unique_lock<std::shared_mutex> lock(buckets_mutex_);
  buckets_[provider_id] = std::move(bucket);
  SPDLOG_DEBUG("RateLimiter: {} -> {} qps / burst {}", provider_id, budget.max_qps, budget.burst_size);
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::FindBucket(const std::string& provider_id) const {
  std::shared_lock<std::shared_mutex> lock(buckets_mutex_);
  auto it = buckets_.find(provider_id);
  return it == buckets_.end() ? nullptr : it->second;
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::GetBucket(const std::string& provider_id) {
  if (auto bucket = FindBucket(provider_id)) {
    return bucket;
  }

  std::unique_lock<std::shared_mutex> lock(buckets_mutex_);
  auto& slot = buckets_[provider_id];
  if (!slot) {
    slot = std::make_shared<Bucket>();
    slot->budget = default_budget_;
    slot->tokens = default_budget_.burst_size;
    slot->last_refill = time_source_();
  }
  return slot;
}

void RateLimiter::Refill(Bucket& bucket, common::SteadyClock::time_point now) {
  if (now <= bucket.last_refill) {
    return;
  }
  double elapsed_s = std::chrono::duration<double>(now - bucket.last_refill).count();
  bucket.tokens = std::min(bucket.budget.burst_size, bucket.tokens + elapsed_s * bucket.budget.max_qps);
  bucket.last_refill = now;
}

bool RateLimiter::TryConsume(Bucket& bucket, std::chrono::nanoseconds& wait_hint, bool count_denial) {
  std::lock_guard<std::mutex> lock(bucket.mutex);
  Refill(bucket, time_source_());
  if (bucket.tokens >= 1.0) {
    bucket.tokens -= 1.0;
    ++bucket.allowed;
    return true;
  }

  if (count_denial) {
    ++bucket.denied;
  }
  if (bucket.budget.max_qps > 0.0) {
    const double wait_s = std::min((1.0 - bucket.tokens) / bucket.budget.max_qps,
                                   std::chrono::duration<double>(kMaxWaitHint).count());
    wait_hint = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(wait_s));
  } else {
    wait_hint = std::chrono::nanoseconds::max();
  }
  return false;
}

bool RateLimiter::TryAcquire(const std::string& provider_id) {
  auto bucket = GetBucket(provider_id);
  std::chrono::nanoseconds wait_hint{0};
  if (TryConsume(*bucket, wait_hint, true)) {
    return true;
  }
  common::EmitMetric(metrics_, common::metrics::kRateLimitRejected, {{"provider", provider_id}});
  return false;
}

AcquireResult RateLimiter::AcquireBlocking(const std::string& provider_id,
                                           std::chrono::milliseconds timeout) {
  auto bucket = GetBucket(provider_id);
  // Deadline is measured on the real clock since the wait is a real sleep
  const auto start = common::SteadyClock::now();
  const auto deadline = start + timeout;

  AcquireResult result;
  while (true) {
    std::chrono::nanoseconds wait_hint{0};
    if (TryConsume(*bucket, wait_hint, false)) {
      result.status = AcquireResult::Status::kPermit;
      break;
    }

    auto now = common::SteadyClock::now();
    if (now >= deadline) {
      result.status = AcquireResult::Status::kTimeout;
      {
        std::lock_guard<std::mutex> lock(bucket->mutex);
        ++bucket->denied;
      }
      common::EmitMetric(metrics_, common::metrics::kRateLimitRejected,
                         {{"provider", provider_id}, {"mode", "blocking"}});
      SPDLOG_DEBUG("RateLimiter: {} timed out after {}ms", provider_id, timeout.count());
      break;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(deadline - now);
    auto sleep_for = std::min(std::max(wait_hint, std::chrono::nanoseconds(std::chrono::microseconds(500))),
                              remaining);
    std::this_thread::sleep_for(sleep_for);
  }

  result.waited = std::chrono::duration_cast<std::chrono::milliseconds>(common::SteadyClock::now() - start);
  return result;
}

RateLimitBudget RateLimiter::GetBudget(const std::string& provider_id) const {
  if (auto bucket = FindBucket(provider_id)) {
    return bucket->budget;
  }
  std::shared_lock<std::shared_mutex> lock(buckets_mutex_);
  return default_budget_;
}

RateLimiterStats RateLimiter::GetStats(const std::string& provider_id) const {
  RateLimiterStats stats;
  auto bucket = FindBucket(provider_id);
  if (!bucket) {
    std::shared_lock<std::shared_mutex> lock(buckets_mutex_);
    stats.available_tokens = default_budget_.burst_size;
    return stats;
  }
  std::lock_guard<std::mutex> lock(bucket->mutex);
  stats.allowed = bucket->allowed;
  stats.denied = bucket->denied;
  stats.available_tokens = bucket->tokens;
  return stats;
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
