#pragma once

#include "history_replay_source.hpp"
#include "rate_limiter.hpp"
#include <chrono>
#include <memory>

namespace mdstream {
namespace engine {
namespace streaming {

/**
 * @brief Takes a provider permit before every history request
 *
 * Used for request paths that do not hold a permit of their own (cache
 * snapshots). Throws RateLimitExceeded when no permit arrives within
 * permit_timeout; the inner source is not called in that case.
 */
class RateLimitedHistorySource : public HistoryReplaySource {
 public:
  RateLimitedHistorySource(std::shared_ptr<HistoryReplaySource> inner,
                           RateLimiter& rate_limiter,
                           std::chrono::milliseconds permit_timeout);

  TickBatch Fetch(const ConnectionKey& key,
                  const std::vector<std::string>& symbols,
                  const RecoveryWindow& window) override;

 private:
  std::shared_ptr<HistoryReplaySource> inner_;
  RateLimiter& rate_limiter_;
  std::chrono::milliseconds permit_timeout_;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
