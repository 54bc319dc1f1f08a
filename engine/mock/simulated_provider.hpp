#pragma once

#include "engine/common/config_manager.hpp"
#include "engine/common/time_source.hpp"
#include "engine/streaming/tick.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace mdstream {
namespace engine {
namespace mock {

struct SimulatedProviderOptions {
  std::string provider_id = "SIM";
  std::string api_key;                          // empty accepts any key
  double base_price = 100.0;
  double price_volatility = 0.001;              // per-tick random walk sigma
  std::chrono::milliseconds tick_interval{100};
  size_t history_capacity = 10000;              // per symbol

  // mock_provider.*
  static SimulatedProviderOptions FromConfig(const common::ConfigManager& config);
};

// Random-walk tick generator with per-symbol history
//
// Ticks are generated on an update thread for every symbol with at least
// one subscriber and fanned out to registered listeners. Every generated
// tick is kept for history queries.
class SimulatedProvider {
 public:
  using TickListener = std::function<void(const streaming::Tick& tick)>;

  explicit SimulatedProvider(SimulatedProviderOptions options,
                             common::WallTimeSource wall_time_source = common::DefaultWallTimeSource());
  ~SimulatedProvider();

  // Non-copyable, non-movable
  SimulatedProvider(const SimulatedProvider&) = delete;
  SimulatedProvider& operator=(const SimulatedProvider&) = delete;

  void Start();
  void Stop();

  bool CheckApiKey(const std::string& api_key) const;
  const std::string& GetProviderId() const { return options_.provider_id; }

  uint64_t AddListener(TickListener listener);
  void RemoveListener(uint64_t listener_id);

  // Reference counted across sessions
  void AddSymbols(const std::vector<std::string>& symbols);
  void RemoveSymbols(const std::vector<std::string>& symbols);
  std::vector<std::string> GetActiveSymbols() const;

  // Advances the walk for one symbol and records the tick
  streaming::Tick GenerateTick(const std::string& symbol);

  // Ticks in [from_ms, to_ms], oldest first, at most limit
  streaming::TickBatch GetHistory(const std::vector<std::string>& symbols,
                                  int64_t from_ms, int64_t to_ms, size_t limit) const;

  // Fixed starting prices: {"AAPL": 189.5, "MSFT": 410.0}
  bool LoadPriceFixture(const std::string& json_data);
  bool LoadPriceFixtureFromFile(const std::string& file_path);

 private:
  void UpdateLoop();
  double NextPrice(const std::string& symbol);

  SimulatedProviderOptions options_;
  common::WallTimeSource wall_time_source_;

  std::atomic<bool> running_{false};
  std::thread update_thread_;

  mutable std::mutex mutex_;
  std::mt19937 rng_;
  std::normal_distribution<double> price_dist_;
  std::uniform_real_distribution<double> volume_dist_;
  std::map<std::string, double> prices_;
  std::map<std::string, int> active_symbols_;
  std::map<std::string, std::deque<streaming::Tick>> history_;

  std::mutex listeners_mutex_;
  std::map<uint64_t, TickListener> listeners_;
  uint64_t next_listener_id_ = 1;
};

}  // namespace mock
}  // namespace engine
}  // namespace mdstream
