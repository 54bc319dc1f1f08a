#pragma once

#include "cache_entry.hpp"

#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace mdstream {
namespace engine {
namespace caching {

/**
 * @brief In-process LRU tier with a category index
 *
 * The category index keeps category invalidation off the full key space.
 * A category whose index grows past max_category_index_size stops being
 * indexed; invalidating it, or any invalidation while the index disagrees
 * with the LRU, falls back to a linear scan and rebuilds the index.
 *
 * Expiry is not enforced here; the tier manager decides whether a stored
 * entry is fresh, stale or dead.
 */
class HotTier {
 public:
  explicit HotTier(size_t capacity, size_t max_category_index_size = 10000);

  // Non-copyable, non-movable
  HotTier(const HotTier&) = delete;
  HotTier& operator=(const HotTier&) = delete;

  // Marks the entry most recently used
  std::optional<CacheEntry> Get(const std::string& key);

  // Returns the number of entries evicted to make room
  size_t Put(CacheEntry entry);
  bool Erase(const std::string& key);

  size_t EraseCategory(const std::string& category);
  // Linear scan; prefer EraseCategory when the prefix is a category
  size_t ErasePrefix(const std::string& prefix);

  size_t Size() const;
  uint64_t GetEvictions() const;
  uint64_t GetIndexFallbacks() const;
  bool IsIndexConsistent() const;

 private:
  struct Node {
    CacheEntry entry;
    bool indexed = false;
  };
  using LruList = std::list<Node>;

  void IndexLocked(Node& node);
  void UnindexLocked(const Node& node);
  void EraseLocked(LruList::iterator it);
  bool IndexConsistentLocked() const;
  void RebuildIndexLocked();

  const size_t capacity_;
  const size_t max_category_index_size_;

  mutable std::mutex mutex_;
  LruList lru_;  // front is most recently used
  std::unordered_map<std::string, LruList::iterator> entries_;
  std::unordered_map<std::string, std::unordered_set<std::string>> category_index_;
  std::unordered_set<std::string> overflowed_categories_;
  size_t indexed_count_ = 0;
  size_t unindexed_count_ = 0;
  uint64_t evictions_ = 0;
  uint64_t index_fallbacks_ = 0;
};

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
