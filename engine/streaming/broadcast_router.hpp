#pragma once

#include "broadcast_bus.hpp"
#include "connection_supervisor.hpp"
#include "delivery_strategy.hpp"
#include "feature_flags.hpp"
#include "tick.hpp"
#include "engine/common/rcu_ptr.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace mdstream {
namespace engine {
namespace streaming {

struct LegacyReadiness {
  bool ready = false;
  std::string reason;
};

struct RouterStats {
  DeliveryMode mode = DeliveryMode::kGateway;
  uint64_t ticks_in = 0;
  uint64_t delivered = 0;
  uint64_t failed = 0;
  uint64_t dropped = 0;
  size_t consumers = 0;
  size_t legacy_only_consumers = 0;

  nlohmann::json ToJson() const;
};

/**
 * @brief Single outbound path from provider connections to consumers
 *
 * OnTick() hands each tick to the active DeliveryStrategy, selected from
 * the FeatureFlagSet. A mode change (emergency override) swaps the strategy
 * snapshot; in-flight deliveries finish on the strategy they started with.
 */
class BroadcastRouter {
 public:
  BroadcastRouter(std::shared_ptr<FeatureFlagSet> flags, ConnectionSupervisor& supervisor);
  ~BroadcastRouter();

  // Non-copyable, non-movable
  BroadcastRouter(const BroadcastRouter&) = delete;
  BroadcastRouter& operator=(const BroadcastRouter&) = delete;

  /** @brief Validates the flag set; throws ConfigConflict and stays stopped */
  void Start();
  void Stop();
  bool IsRunning() const { return running_.load(); }

  //=== Consumers ===
  bool RegisterConsumer(const std::string& consumer_id, DeliveryCallback callback, bool legacy_only = false);
  bool UnregisterConsumer(const std::string& consumer_id);

  /** @brief Throws std::invalid_argument for an unregistered consumer */
  ConnectionId Subscribe(const std::string& consumer_id, const ConnectionKey& key,
                         const std::vector<std::string>& symbols);
  void Unsubscribe(const std::string& consumer_id, const ConnectionKey& key,
                   const std::vector<std::string>& symbols);

  //=== Delivery ===
  size_t OnTick(ConnectionId connection_id, const Tick& tick);
  size_t OnTicks(ConnectionId connection_id, const TickBatch& ticks);

  //=== Legacy removal ===
  LegacyReadiness IsReadyForLegacyRemoval() const;
  bool EmergencyEnableLegacy(const std::string& reason);
  bool CloseEmergencyOverride(const std::string& reason);
  DeliveryMode GetDeliveryMode() const;

  RouterStats GetStats() const;
  FeatureFlagSet& GetFlags() { return *flags_; }

 private:
  std::shared_ptr<DeliveryStrategy> BuildStrategy(DeliveryMode mode) const;
  void OnModeChanged(DeliveryMode mode);

  std::shared_ptr<FeatureFlagSet> flags_;
  ConnectionSupervisor& supervisor_;

  ConsumerRegistry registry_;
  BroadcastBus bus_;
  common::RCUPtr<DeliveryStrategy> strategy_{nullptr};
  std::atomic<bool> running_{false};

  // consumer -> symbol -> keys carrying it; drives bus unsubscribes
  std::mutex subscriptions_mutex_;
  std::map<std::string, std::map<std::string, std::set<ConnectionKey>>> subscriptions_;

  std::atomic<uint64_t> ticks_in_{0};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> dropped_{0};
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
