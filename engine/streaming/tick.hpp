#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace mdstream {
namespace engine {
namespace streaming {

// Identity of a logical provider link, e.g. {"P1", "quote"}
struct ConnectionKey {
  std::string provider_id;
  std::string capability_id;

  std::string ToString() const { return provider_id + "/" + capability_id; }

  bool operator==(const ConnectionKey& other) const {
    return provider_id == other.provider_id && capability_id == other.capability_id;
  }
  bool operator<(const ConnectionKey& other) const {
    if (provider_id != other.provider_id) return provider_id < other.provider_id;
    return capability_id < other.capability_id;
  }
};

struct ConnectionKeyHash {
  size_t operator()(const ConnectionKey& key) const {
    return std::hash<std::string>{}(key.provider_id) ^
           (std::hash<std::string>{}(key.capability_id) << 1);
  }
};

// Single market data update as received from a provider
struct Tick {
  std::string symbol;
  uint64_t sequence = 0;       // per-connection, 0 when the provider does not sequence
  double last_price = 0.0;
  double bid_price = 0.0;
  double ask_price = 0.0;
  double volume = 0.0;
  int64_t timestamp_ms = 0;    // provider event time, epoch milliseconds
  bool recovered = false;      // replayed by the recovery worker
};

using TickBatch = std::vector<Tick>;

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
