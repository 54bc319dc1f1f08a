#include "delivery_strategy.hpp"
#include <spdlog/spdlog.h>

namespace mdstream {
namespace engine {
namespace streaming {

DirectDeliveryStrategy::DirectDeliveryStrategy(const ConsumerRegistry& registry,
                                               ConnectionConsumerLookup lookup,
                                               bool legacy_only_consumers)
    : registry_(registry), lookup_(std::move(lookup)), legacy_only_consumers_(legacy_only_consumers) {}

DeliveryOutcome DirectDeliveryStrategy::Deliver(uint64_t connection_id, const Tick& tick) {
  DeliveryOutcome outcome;
  if (!lookup_) {
    return outcome;
  }
  for (const auto& consumer_id : lookup_(connection_id, tick.symbol)) {
    auto endpoint = registry_.Find(consumer_id);
    if (!endpoint || (legacy_only_consumers_ && !endpoint->legacy_only)) {
      continue;
    }
    if (endpoint->Deliver(tick)) {
      ++outcome.delivered;
    } else {
      ++outcome.failed;
    }
  }
  return outcome;
}

GatewayDeliveryStrategy::GatewayDeliveryStrategy(const BroadcastBus& bus, FeatureFlagSet& flags,
                                                 std::unique_ptr<DirectDeliveryStrategy> legacy_fallback)
    : bus_(bus), flags_(flags), legacy_fallback_(std::move(legacy_fallback)) {}

DeliveryOutcome GatewayDeliveryStrategy::Deliver(uint64_t connection_id, const Tick& tick) {
  auto published = bus_.Publish(tick);
  DeliveryOutcome outcome{published.delivered, published.failed};

  if (published.delivered + published.failed > 0) {
    flags_.RecordGatewayResult(published.failed, published.delivered + published.failed);
  }
  if (published.failed > 0 && legacy_fallback_) {
    SPDLOG_DEBUG("GatewayDeliveryStrategy: {} failed broadcasts for {}", published.failed, tick.symbol);
    flags_.RecordFallbackTrigger();
  }

  if (legacy_fallback_) {
    auto legacy = legacy_fallback_->Deliver(connection_id, tick);
    outcome.delivered += legacy.delivered;
    outcome.failed += legacy.failed;
  }
  return outcome;
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
