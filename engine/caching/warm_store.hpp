#pragma once

#include "cache_entry.hpp"
#include "engine/common/time_source.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mdstream {
namespace engine {
namespace caching {

/**
 * @brief Shared second tier behind the hot tier
 *
 * Implementations expire entries by TTL on their own. Any method may throw
 * on a backend failure; CacheTierManager logs and absorbs it.
 */
class WarmStore {
 public:
  virtual ~WarmStore() = default;

  virtual void Set(const CacheEntry& entry, std::chrono::milliseconds ttl) = 0;
  virtual std::optional<CacheEntry> Get(const std::string& key) = 0;
  virtual bool Delete(const std::string& key) = 0;
  virtual std::vector<std::string> ScanPrefix(const std::string& prefix) = 0;
};

// Ordered map with lazy TTL expiry
class InMemoryWarmStore : public WarmStore {
 public:
  explicit InMemoryWarmStore(common::WallTimeSource wall_time_source = common::DefaultWallTimeSource());

  void Set(const CacheEntry& entry, std::chrono::milliseconds ttl) override;
  std::optional<CacheEntry> Get(const std::string& key) override;
  bool Delete(const std::string& key) override;
  std::vector<std::string> ScanPrefix(const std::string& prefix) override;

  size_t Size();

 private:
  struct Slot {
    CacheEntry entry;
    int64_t evict_at_ms = 0;
  };

  void PurgeExpiredLocked(int64_t now_ms);

  common::WallTimeSource wall_time_source_;
  std::mutex mutex_;
  std::map<std::string, Slot> slots_;
};

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
