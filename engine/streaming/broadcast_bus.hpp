#pragma once

#include "tick.hpp"
#include "engine/common/rcu_ptr.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace mdstream {
namespace engine {
namespace streaming {

using DeliveryCallback = std::function<void(const Tick& tick)>;

// A downstream consumer socket or in-process sink
struct ConsumerEndpoint {
  std::string id;
  DeliveryCallback callback;
  bool legacy_only = false;
  std::atomic<uint64_t> delivered{0};
  std::atomic<uint64_t> failed{0};

  ConsumerEndpoint(std::string consumer_id, DeliveryCallback cb, bool legacy)
      : id(std::move(consumer_id)), callback(std::move(cb)), legacy_only(legacy) {}

  /** @brief Invoke the callback; false if it threw */
  bool Deliver(const Tick& tick);
};

using ConsumerEndpointPtr = std::shared_ptr<ConsumerEndpoint>;

// Registered consumers. Lookups are lock-free snapshot reads.
class ConsumerRegistry {
 public:
  ConsumerRegistry() = default;

  // Non-copyable, non-movable
  ConsumerRegistry(const ConsumerRegistry&) = delete;
  ConsumerRegistry& operator=(const ConsumerRegistry&) = delete;

  bool Add(ConsumerEndpointPtr endpoint);
  ConsumerEndpointPtr Remove(const std::string& consumer_id);
  ConsumerEndpointPtr Find(const std::string& consumer_id) const;

  size_t Size() const;
  size_t CountLegacyOnly() const;

 private:
  using Table = std::unordered_map<std::string, ConsumerEndpointPtr>;
  common::RCUPtr<Table> table_;
};

/**
 * @brief Symbol-keyed fan-out for gateway delivery
 *
 * Consumers subscribe by symbol, independent of the physical provider
 * connection. Publish() walks an immutable subscription snapshot, so
 * publishers never contend with subscribe/unsubscribe.
 */
class BroadcastBus {
 public:
  struct PublishResult {
    size_t delivered = 0;
    size_t failed = 0;
  };

  BroadcastBus() = default;

  // Non-copyable, non-movable
  BroadcastBus(const BroadcastBus&) = delete;
  BroadcastBus& operator=(const BroadcastBus&) = delete;

  void Subscribe(const ConsumerEndpointPtr& endpoint, const std::vector<std::string>& symbols);
  void Unsubscribe(const std::string& consumer_id, const std::vector<std::string>& symbols);
  void RemoveConsumer(const std::string& consumer_id);

  PublishResult Publish(const Tick& tick) const;

  std::vector<std::string> GetSubscribers(const std::string& symbol) const;
  size_t GetSymbolCount() const;

 private:
  // symbol -> consumer id -> endpoint; ordered so fan-out order is stable
  using Table = std::unordered_map<std::string, std::map<std::string, ConsumerEndpointPtr>>;
  common::RCUPtr<Table> table_;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
