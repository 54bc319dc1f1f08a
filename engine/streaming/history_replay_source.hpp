#pragma once

#include "tick.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace mdstream {
namespace engine {
namespace streaming {

// Bounded time interval for a replay request, epoch milliseconds
struct RecoveryWindow {
  int64_t from_ms = 0;
  int64_t to_ms = 0;
  size_t max_points = 1000;

  int64_t DurationMs() const { return to_ms - from_ms; }
};

/**
 * @brief Provider history backend used to replay missed ticks
 *
 * Fetch() throws RecoveryUnavailable when the backend cannot be reached and
 * TransportError for any other failed request. Returned ticks may be
 * unordered.
 */
class HistoryReplaySource {
 public:
  virtual ~HistoryReplaySource() = default;

  virtual TickBatch Fetch(const ConnectionKey& key,
                          const std::vector<std::string>& symbols,
                          const RecoveryWindow& window) = 0;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
