#include "rate_limited_history_source.hpp"
#include "engine/common/errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace mdstream {
namespace engine {
namespace streaming {

RateLimitedHistorySource::RateLimitedHistorySource(std::shared_ptr<HistoryReplaySource> inner,
                                                   RateLimiter& rate_limiter,
                                                   std::chrono::milliseconds permit_timeout)
    : inner_(std::move(inner)), rate_limiter_(rate_limiter), permit_timeout_(permit_timeout) {
  if (!inner_) {
    throw std::invalid_argument("RateLimitedHistorySource requires a history source");
  }
}

TickBatch RateLimitedHistorySource::Fetch(const ConnectionKey& key,
                                          const std::vector<std::string>& symbols,
                                          const RecoveryWindow& window) {
  const AcquireResult permit = rate_limiter_.AcquireBlocking(key.provider_id, permit_timeout_);
  if (!permit.IsPermit()) {
    SPDLOG_WARN("RateLimitedHistorySource: no permit for {} within {}ms", key.ToString(), permit_timeout_.count());
    throw common::RateLimitExceeded("history request for " + key.ToString() + " not permitted within " +
                                    std::to_string(permit_timeout_.count()) + "ms");
  }
  return inner_->Fetch(key, symbols, window);
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
