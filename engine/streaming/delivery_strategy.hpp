#pragma once

#include "broadcast_bus.hpp"
#include "feature_flags.hpp"
#include "tick.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mdstream {
namespace engine {
namespace streaming {

// Consumers attached to a physical connection for a symbol
using ConnectionConsumerLookup =
    std::function<std::vector<std::string>(uint64_t connection_id, const std::string& symbol)>;

struct DeliveryOutcome {
  size_t delivered = 0;
  size_t failed = 0;
};

/**
 * @brief How an inbound tick reaches consumers
 *
 * One implementation is active at a time; the router swaps it when the
 * delivery mode changes.
 */
class DeliveryStrategy {
 public:
  virtual ~DeliveryStrategy() = default;

  virtual DeliveryMode Mode() const = 0;
  virtual DeliveryOutcome Deliver(uint64_t connection_id, const Tick& tick) = 0;
};

// Legacy: push straight to the consumers of the receiving connection
class DirectDeliveryStrategy : public DeliveryStrategy {
 public:
  DirectDeliveryStrategy(const ConsumerRegistry& registry, ConnectionConsumerLookup lookup,
                         bool legacy_only_consumers = false);

  DeliveryMode Mode() const override { return DeliveryMode::kLegacy; }
  DeliveryOutcome Deliver(uint64_t connection_id, const Tick& tick) override;

 private:
  const ConsumerRegistry& registry_;
  ConnectionConsumerLookup lookup_;
  bool legacy_only_consumers_;
};

/**
 * @brief Gateway: publish to the broadcast bus
 *
 * Legacy-only consumers are served through the direct fallback when
 * allow_legacy_fallback is set, and not at all otherwise. Failed bus
 * deliveries count as fallback triggers toward auto-rollback.
 */
class GatewayDeliveryStrategy : public DeliveryStrategy {
 public:
  GatewayDeliveryStrategy(const BroadcastBus& bus, FeatureFlagSet& flags,
                          std::unique_ptr<DirectDeliveryStrategy> legacy_fallback);

  DeliveryMode Mode() const override { return DeliveryMode::kGateway; }
  DeliveryOutcome Deliver(uint64_t connection_id, const Tick& tick) override;

  bool HasLegacyFallback() const { return legacy_fallback_ != nullptr; }

 private:
  const BroadcastBus& bus_;
  FeatureFlagSet& flags_;
  std::unique_ptr<DirectDeliveryStrategy> legacy_fallback_;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
