#include "simulated_provider.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace mdstream {
namespace engine {
namespace mock {

SimulatedProviderOptions SimulatedProviderOptions::FromConfig(const common::ConfigManager& config) {
  SimulatedProviderOptions options;
  options.provider_id = config.GetString("mock_provider.provider_id", options.provider_id);
  options.api_key = config.GetString("mock_provider.api_key", options.api_key);
  options.base_price = config.GetDouble("mock_provider.base_price", options.base_price);
  options.price_volatility = config.GetDouble("mock_provider.price_volatility", options.price_volatility);
  options.tick_interval = config.GetMilliseconds("mock_provider.tick_interval_ms", options.tick_interval);
  options.history_capacity = static_cast<size_t>(std::max<int64_t>(
      1, config.GetInt64("mock_provider.history_capacity", static_cast<int64_t>(options.history_capacity))));
  return options;
}

SimulatedProvider::SimulatedProvider(SimulatedProviderOptions options, common::WallTimeSource wall_time_source)
    : options_(std::move(options)),
      wall_time_source_(std::move(wall_time_source)),
      rng_(std::random_device{}()),
      price_dist_(0.0, options_.price_volatility),
      volume_dist_(1.0, 1000.0) {}

SimulatedProvider::~SimulatedProvider() {
  Stop();
}

void SimulatedProvider::Start() {
  if (!running_.exchange(true)) {
    update_thread_ = std::thread(&SimulatedProvider::UpdateLoop, this);
    SPDLOG_INFO("SimulatedProvider: {} started, tick interval {}ms",
                options_.provider_id, options_.tick_interval.count());
  }
}

void SimulatedProvider::Stop() {
  if (running_.exchange(false)) {
    if (update_thread_.joinable()) {
      update_thread_.join();
    }
    SPDLOG_INFO("SimulatedProvider: {} stopped", options_.provider_id);
  }
}

bool SimulatedProvider::CheckApiKey(const std::string& api_key) const {
  return options_.api_key.empty() || api_key == options_.api_key;
}

uint64_t SimulatedProvider::AddListener(TickListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  const uint64_t id = next_listener_id_++;
  listeners_[id] = std::move(listener);
  return id;
}

void SimulatedProvider::RemoveListener(uint64_t listener_id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.erase(listener_id);
}

void SimulatedProvider::AddSymbols(const std::vector<std::string>& symbols) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& symbol : symbols) {
    ++active_symbols_[symbol];
  }
}

void SimulatedProvider::RemoveSymbols(const std::vector<std::string>& symbols) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& symbol : symbols) {
    auto it = active_symbols_.find(symbol);
    if (it != active_symbols_.end() && --it->second <= 0) {
      active_symbols_.erase(it);
    }
  }
}

std::vector<std::string> SimulatedProvider::GetActiveSymbols() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> symbols;
  symbols.reserve(active_symbols_.size());
  for (const auto& [symbol, refs] : active_symbols_) {
    symbols.push_back(symbol);
  }
  return symbols;
}

double SimulatedProvider::NextPrice(const std::string& symbol) {
  auto it = prices_.find(symbol);
  if (it == prices_.end()) {
    it = prices_.emplace(symbol, options_.base_price).first;
  }
  it->second = std::max(0.01, it->second + price_dist_(rng_) * it->second);
  return it->second;
}

streaming::Tick SimulatedProvider::GenerateTick(const std::string& symbol) {
  streaming::Tick tick;
  tick.symbol = symbol;
  tick.timestamp_ms = common::ToEpochMillis(wall_time_source_());

  std::lock_guard<std::mutex> lock(mutex_);
  tick.last_price = NextPrice(symbol);
  const double half_spread = tick.last_price * 0.0005;
  tick.bid_price = tick.last_price - half_spread;
  tick.ask_price = tick.last_price + half_spread;
  tick.volume = std::floor(volume_dist_(rng_));

  auto& history = history_[symbol];
  history.push_back(tick);
  while (history.size() > options_.history_capacity) {
    history.pop_front();
  }
  return tick;
}

streaming::TickBatch SimulatedProvider::GetHistory(const std::vector<std::string>& symbols,
                                                   int64_t from_ms, int64_t to_ms, size_t limit) const {
  streaming::TickBatch batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& symbol : symbols) {
      auto it = history_.find(symbol);
      if (it == history_.end()) {
        continue;
      }
      for (const auto& tick : it->second) {
        if (tick.timestamp_ms >= from_ms && tick.timestamp_ms <= to_ms) {
          batch.push_back(tick);
        }
      }
    }
  }
  std::stable_sort(batch.begin(), batch.end(), [](const streaming::Tick& a, const streaming::Tick& b) {
    return a.timestamp_ms < b.timestamp_ms;
  });
  if (limit > 0 && batch.size() > limit) {
    batch.resize(limit);
  }
  return batch;
}

void SimulatedProvider::UpdateLoop() {
  while (running_.load()) {
    for (const auto& symbol : GetActiveSymbols()) {
      const auto tick = GenerateTick(symbol);
      std::vector<TickListener> listeners;
      {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [id, listener] : listeners_) {
          listeners.push_back(listener);
        }
      }
      for (const auto& listener : listeners) {
        listener(tick);
      }
    }
    std::this_thread::sleep_for(options_.tick_interval);
  }
}

bool SimulatedProvider::LoadPriceFixture(const std::string& json_data) {
  try {
    nlohmann::json node = nlohmann::json::parse(json_data);
    if (!node.is_object()) {
      SPDLOG_ERROR("SimulatedProvider: price fixture must be an object");
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : node.items()) {
      if (item.value().is_number() && item.value().get<double>() > 0.0) {
        prices_[item.key()] = item.value().get<double>();
      }
    }
    SPDLOG_INFO("SimulatedProvider: loaded {} fixture prices", prices_.size());
    return true;
  } catch (const nlohmann::json::exception& e) {
    SPDLOG_ERROR("SimulatedProvider: failed to load price fixture: {}", e.what());
    return false;
  }
}

bool SimulatedProvider::LoadPriceFixtureFromFile(const std::string& file_path) {
  std::ifstream file(file_path);
  if (!file.is_open()) {
    SPDLOG_ERROR("SimulatedProvider: failed to open fixture file {}", file_path);
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return LoadPriceFixture(buffer.str());
}

}  // namespace mock
}  // namespace engine
}  // namespace mdstream
