#include "metrics_emitter.hpp"
#include <spdlog/spdlog.h>

namespace mdstream {
namespace engine {
namespace common {

CountingMetricsEmitter::CountingMetricsEmitter(size_t max_recent_events)
    : max_recent_events_(max_recent_events) {
  recent_events_.reserve(max_recent_events_);
}

void CountingMetricsEmitter::Emit(const std::string& name, const MetricTags& tags, double value) {
  SPDLOG_TRACE("Metrics: {} += {} ({} tags)", name, value, tags.size());
  std::lock_guard<std::mutex> lock(mutex_);
  counters_[name] += value;
  if (max_recent_events_ == 0) {
    return;
  }
  if (recent_events_.size() >= max_recent_events_) {
    recent_events_.erase(recent_events_.begin());
  }
  recent_events_.push_back(Event{name, tags, value});
}

double CountingMetricsEmitter::GetCount(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find(name);
  return it != counters_.end() ? it->second : 0.0;
}

std::vector<CountingMetricsEmitter::Event> CountingMetricsEmitter::GetRecentEvents(
    const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (name.empty()) {
    return recent_events_;
  }
  std::vector<Event> result;
  for (const auto& event : recent_events_) {
    if (event.name == name) {
      result.push_back(event);
    }
  }
  return result;
}

nlohmann::json CountingMetricsEmitter::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json counters = nlohmann::json::object();
  for (const auto& [name, value] : counters_) {
    counters[name] = value;
  }
  return counters;
}

void CountingMetricsEmitter::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_.clear();
  recent_events_.clear();
}

}  // namespace common
}  // namespace engine
}  // namespace mdstream
