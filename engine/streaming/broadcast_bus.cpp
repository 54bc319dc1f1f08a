#include "broadcast_bus.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace mdstream {
namespace engine {
namespace streaming {

bool ConsumerEndpoint::Deliver(const Tick& tick) {
  try {
    callback(tick);
    delivered.fetch_add(1, std::memory_order_relaxed);
    return true;
  } catch (const std::exception& e) {
    failed.fetch_add(1, std::memory_order_relaxed);
    SPDLOG_WARN("ConsumerEndpoint: delivery to {} failed: {}", id, e.what());
    return false;
  }
}

//=============================================================================
// ConsumerRegistry
//=============================================================================

bool ConsumerRegistry::Add(ConsumerEndpointPtr endpoint) {
  return table_.Mutate([&endpoint](Table& table) {
    return table.emplace(endpoint->id, endpoint).second;
  });
}

ConsumerEndpointPtr ConsumerRegistry::Remove(const std::string& consumer_id) {
  return table_.Mutate([&consumer_id](Table& table) -> ConsumerEndpointPtr {
    auto it = table.find(consumer_id);
    if (it == table.end()) {
      return nullptr;
    }
    auto endpoint = it->second;
    table.erase(it);
    return endpoint;
  });
}

ConsumerEndpointPtr ConsumerRegistry::Find(const std::string& consumer_id) const {
  auto snapshot = table_.Read();
  auto it = snapshot->find(consumer_id);
  return it == snapshot->end() ? nullptr : it->second;
}

size_t ConsumerRegistry::Size() const {
  return table_.Read()->size();
}

size_t ConsumerRegistry::CountLegacyOnly() const {
  auto snapshot = table_.Read();
  return static_cast<size_t>(std::count_if(snapshot->begin(), snapshot->end(),
                                           [](const auto& entry) { return entry.second->legacy_only; }));
}

//=============================================================================
// BroadcastBus
//=============================================================================

void BroadcastBus::Subscribe(const ConsumerEndpointPtr& endpoint, const std::vector<std::string>& symbols) {
  table_.Mutate([&](Table& table) {
    for (const auto& symbol : symbols) {
      table[symbol][endpoint->id] = endpoint;
    }
  });
}

void BroadcastBus::Unsubscribe(const std::string& consumer_id, const std::vector<std::string>& symbols) {
  table_.Mutate([&](Table& table) {
    for (const auto& symbol : symbols) {
      auto it = table.find(symbol);
      if (it == table.end()) {
        continue;
      }
      it->second.erase(consumer_id);
      if (it->second.empty()) {
        table.erase(it);
      }
    }
  });
}

void BroadcastBus::RemoveConsumer(const std::string& consumer_id) {
  table_.Mutate([&consumer_id](Table& table) {
    for (auto it = table.begin(); it != table.end();) {
      it->second.erase(consumer_id);
      it = it->second.empty() ? table.erase(it) : std::next(it);
    }
  });
}

BroadcastBus::PublishResult BroadcastBus::Publish(const Tick& tick) const {
  PublishResult result;
  auto snapshot = table_.Read();
  auto it = snapshot->find(tick.symbol);
  if (it == snapshot->end()) {
    return result;
  }
  for (const auto& [consumer_id, endpoint] : it->second) {
    if (endpoint->Deliver(tick)) {
      ++result.delivered;
    } else {
      ++result.failed;
    }
  }
  return result;
}

std::vector<std::string> BroadcastBus::GetSubscribers(const std::string& symbol) const {
  std::vector<std::string> ids;
  auto snapshot = table_.Read();
  auto it = snapshot->find(symbol);
  if (it != snapshot->end()) {
    for (const auto& [consumer_id, endpoint] : it->second) {
      ids.push_back(consumer_id);
    }
  }
  return ids;
}

size_t BroadcastBus::GetSymbolCount() const {
  return table_.Read()->size();
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
