#include "broadcast_router.hpp"
#include "engine/common/errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mdstream {
namespace engine {
namespace streaming {

nlohmann::json RouterStats::ToJson() const {
  return nlohmann::json{
      {"mode", ToString(mode)},
      {"ticks_in", ticks_in},
      {"delivered", delivered},
      {"failed", failed},
      {"dropped", dropped},
      {"consumers", consumers},
      {"legacy_only_consumers", legacy_only_consumers}};
}

BroadcastRouter::BroadcastRouter(std::shared_ptr<FeatureFlagSet> flags, ConnectionSupervisor& supervisor)
    : flags_(std::move(flags)), supervisor_(supervisor) {
  if (!flags_) {
    throw std::invalid_argument("BroadcastRouter requires a feature flag set");
  }
}

BroadcastRouter::~BroadcastRouter() {
  Stop();
}

void BroadcastRouter::Start() {
  if (running_.load()) {
    return;
  }
  // Throws ConfigConflict; the router never runs on an inconsistent flag set
  flags_->ValidateOrThrow();

  const DeliveryMode mode = flags_->GetDeliveryMode();
  strategy_.Update(BuildStrategy(mode));
  flags_->SetModeListener([this](DeliveryMode new_mode) { OnModeChanged(new_mode); });
  running_.store(true);
  SPDLOG_INFO("BroadcastRouter: started in {} mode", ToString(mode));
}

void BroadcastRouter::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  flags_->SetModeListener(nullptr);
  strategy_.Update(nullptr);
  SPDLOG_INFO("BroadcastRouter: stopped after {} ticks", ticks_in_.load());
}

std::shared_ptr<DeliveryStrategy> BroadcastRouter::BuildStrategy(DeliveryMode mode) const {
  auto lookup = [this](uint64_t connection_id, const std::string& symbol) {
    return supervisor_.GetConsumers(connection_id, symbol);
  };
  if (mode == DeliveryMode::kLegacy) {
    return std::make_shared<DirectDeliveryStrategy>(registry_, lookup);
  }

  std::unique_ptr<DirectDeliveryStrategy> fallback;
  if (flags_->GetConfig().allow_legacy_fallback) {
    fallback = std::make_unique<DirectDeliveryStrategy>(registry_, lookup, true);
  }
  return std::make_shared<GatewayDeliveryStrategy>(bus_, *flags_, std::move(fallback));
}

void BroadcastRouter::OnModeChanged(DeliveryMode mode) {
  if (!running_.load()) {
    return;
  }
  auto previous = strategy_.Exchange(BuildStrategy(mode));
  SPDLOG_WARN("BroadcastRouter: delivery mode {} -> {}",
              previous ? ToString(previous->Mode()) : "none", ToString(mode));
}

//=============================================================================
// Consumers
//=============================================================================

bool BroadcastRouter::RegisterConsumer(const std::string& consumer_id, DeliveryCallback callback, bool legacy_only) {
  if (consumer_id.empty() || !callback) {
    return false;
  }
  auto endpoint = std::make_shared<ConsumerEndpoint>(consumer_id, std::move(callback), legacy_only);
  if (!registry_.Add(endpoint)) {
    SPDLOG_WARN("BroadcastRouter: consumer {} already registered", consumer_id);
    return false;
  }
  SPDLOG_INFO("BroadcastRouter: registered consumer {}{}", consumer_id, legacy_only ? " (legacy only)" : "");
  return true;
}

bool BroadcastRouter::UnregisterConsumer(const std::string& consumer_id) {
  const size_t population = registry_.Size();
  auto endpoint = registry_.Remove(consumer_id);
  if (!endpoint) {
    return false;
  }
  bus_.RemoveConsumer(consumer_id);
  {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    subscriptions_.erase(consumer_id);
  }
  supervisor_.UnsubscribeAll(consumer_id);
  flags_->RecordClientDisconnections(1, population);
  SPDLOG_INFO("BroadcastRouter: unregistered consumer {} ({} delivered, {} failed)",
              consumer_id, endpoint->delivered.load(), endpoint->failed.load());
  return true;
}

ConnectionId BroadcastRouter::Subscribe(const std::string& consumer_id, const ConnectionKey& key,
                                        const std::vector<std::string>& symbols) {
  auto endpoint = registry_.Find(consumer_id);
  if (!endpoint) {
    throw std::invalid_argument("unknown consumer " + consumer_id);
  }

  {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    auto& held = subscriptions_[consumer_id];
    for (const auto& symbol : symbols) {
      held[symbol].insert(key);
    }
  }
  // Legacy-only consumers are reached through their connection, never the bus
  if (!endpoint->legacy_only) {
    bus_.Subscribe(endpoint, symbols);
  }
  return supervisor_.Subscribe(consumer_id, key, symbols);
}

void BroadcastRouter::Unsubscribe(const std::string& consumer_id, const ConnectionKey& key,
                                  const std::vector<std::string>& symbols) {
  std::vector<std::string> released;
  {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    auto consumer_it = subscriptions_.find(consumer_id);
    if (consumer_it != subscriptions_.end()) {
      auto& held = consumer_it->second;
      for (const auto& symbol : symbols) {
        auto it = held.find(symbol);
        if (it == held.end()) {
          continue;
        }
        it->second.erase(key);
        if (it->second.empty()) {
          held.erase(it);
          released.push_back(symbol);
        }
      }
      if (held.empty()) {
        subscriptions_.erase(consumer_it);
      }
    }
  }
  bus_.Unsubscribe(consumer_id, released);
  supervisor_.Unsubscribe(consumer_id, key, symbols);
}

//=============================================================================
// Delivery
//=============================================================================

size_t BroadcastRouter::OnTick(ConnectionId connection_id, const Tick& tick) {
  ticks_in_.fetch_add(1, std::memory_order_relaxed);
  auto strategy = strategy_.Read();
  if (!strategy) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return 0;
  }
  auto outcome = strategy->Deliver(connection_id, tick);
  delivered_.fetch_add(outcome.delivered, std::memory_order_relaxed);
  failed_.fetch_add(outcome.failed, std::memory_order_relaxed);
  return outcome.delivered;
}

size_t BroadcastRouter::OnTicks(ConnectionId connection_id, const TickBatch& ticks) {
  size_t delivered = 0;
  for (const auto& tick : ticks) {
    delivered += OnTick(connection_id, tick);
  }
  return delivered;
}

//=============================================================================
// Legacy removal
//=============================================================================

LegacyReadiness BroadcastRouter::IsReadyForLegacyRemoval() const {
  const size_t legacy_only = registry_.CountLegacyOnly();
  if (legacy_only > 0) {
    return {false, std::to_string(legacy_only) + " legacy-only consumers still active"};
  }
  if (flags_->IsEmergencyOverrideActive()) {
    return {false, "emergency legacy override is open: " + flags_->GetOverrideReason()};
  }
  const auto config = flags_->GetConfig();
  const double error_rate = flags_->GetGatewayErrorRate();
  if (error_rate > config.max_gateway_error_rate) {
    return {false, "gateway error rate " + std::to_string(error_rate) + " above " +
                       std::to_string(config.max_gateway_error_rate)};
  }
  if (!flags_->IsLegacyRemovalAcknowledged()) {
    return {false, "operator acknowledgement missing"};
  }
  return {true, "ready"};
}

bool BroadcastRouter::EmergencyEnableLegacy(const std::string& reason) {
  return flags_->EmergencyEnableLegacy(reason);
}

bool BroadcastRouter::CloseEmergencyOverride(const std::string& reason) {
  return flags_->CloseEmergencyOverride(reason);
}

DeliveryMode BroadcastRouter::GetDeliveryMode() const {
  return flags_->GetDeliveryMode();
}

RouterStats BroadcastRouter::GetStats() const {
  RouterStats stats;
  auto strategy = strategy_.Read();
  stats.mode = strategy ? strategy->Mode() : flags_->GetDeliveryMode();
  stats.ticks_in = ticks_in_.load();
  stats.delivered = delivered_.load();
  stats.failed = failed_.load();
  stats.dropped = dropped_.load();
  stats.consumers = registry_.Size();
  stats.legacy_only_consumers = registry_.CountLegacyOnly();
  return stats;
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
