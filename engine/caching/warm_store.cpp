#include "warm_store.hpp"

namespace mdstream {
namespace engine {
namespace caching {

InMemoryWarmStore::InMemoryWarmStore(common::WallTimeSource wall_time_source)
    : wall_time_source_(std::move(wall_time_source)) {}

void InMemoryWarmStore::Set(const CacheEntry& entry, std::chrono::milliseconds ttl) {
  const int64_t now_ms = common::ToEpochMillis(wall_time_source_());
  std::lock_guard<std::mutex> lock(mutex_);
  slots_[entry.key] = Slot{entry, now_ms + ttl.count()};
}

std::optional<CacheEntry> InMemoryWarmStore::Get(const std::string& key) {
  const int64_t now_ms = common::ToEpochMillis(wall_time_source_());
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = slots_.find(key);
  if (it == slots_.end()) {
    return std::nullopt;
  }
  if (now_ms >= it->second.evict_at_ms) {
    slots_.erase(it);
    return std::nullopt;
  }
  return it->second.entry;
}

bool InMemoryWarmStore::Delete(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.erase(key) > 0;
}

std::vector<std::string> InMemoryWarmStore::ScanPrefix(const std::string& prefix) {
  const int64_t now_ms = common::ToEpochMillis(wall_time_source_());
  std::lock_guard<std::mutex> lock(mutex_);
  PurgeExpiredLocked(now_ms);
  std::vector<std::string> keys;
  for (auto it = slots_.lower_bound(prefix); it != slots_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    keys.push_back(it->first);
  }
  return keys;
}

size_t InMemoryWarmStore::Size() {
  const int64_t now_ms = common::ToEpochMillis(wall_time_source_());
  std::lock_guard<std::mutex> lock(mutex_);
  PurgeExpiredLocked(now_ms);
  return slots_.size();
}

void InMemoryWarmStore::PurgeExpiredLocked(int64_t now_ms) {
  for (auto it = slots_.begin(); it != slots_.end();) {
    if (now_ms >= it->second.evict_at_ms) {
      it = slots_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
