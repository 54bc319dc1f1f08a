#include "hot_tier.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

namespace mdstream {
namespace engine {
namespace caching {

HotTier::HotTier(size_t capacity, size_t max_category_index_size)
    : capacity_(std::max<size_t>(1, capacity)),
      max_category_index_size_(std::max<size_t>(1, max_category_index_size)) {}

std::optional<CacheEntry> HotTier::Get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  lru_.splice(lru_.begin(), lru_, it->second);
  return it->second->entry;
}

size_t HotTier::Put(CacheEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto existing = entries_.find(entry.key);
  if (existing != entries_.end()) {
    EraseLocked(existing->second);
  }

  lru_.push_front(Node{std::move(entry), false});
  entries_[lru_.front().entry.key] = lru_.begin();
  IndexLocked(lru_.front());

  size_t evicted = 0;
  while (lru_.size() > capacity_) {
    EraseLocked(std::prev(lru_.end()));
    ++evicted;
  }
  evictions_ += evicted;
  return evicted;
}

bool HotTier::Erase(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }
  EraseLocked(it->second);
  return true;
}

size_t HotTier::EraseCategory(const std::string& category) {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool consistent = IndexConsistentLocked();
  const bool overflowed = overflowed_categories_.count(category) > 0;

  if (consistent && !overflowed) {
    auto index_it = category_index_.find(category);
    if (index_it == category_index_.end()) {
      return 0;
    }
    // Copy; EraseLocked() mutates the set
    const std::vector<std::string> keys(index_it->second.begin(), index_it->second.end());
    size_t erased = 0;
    for (const auto& key : keys) {
      auto it = entries_.find(key);
      if (it != entries_.end()) {
        EraseLocked(it->second);
        ++erased;
      }
    }
    return erased;
  }

  ++index_fallbacks_;
  SPDLOG_WARN("HotTier: category {} invalidated by linear scan over {} entries ({})",
              category, lru_.size(), consistent ? "index overflow" : "index inconsistent");
  size_t erased = 0;
  for (auto it = lru_.begin(); it != lru_.end();) {
    auto next = std::next(it);
    if (it->entry.category == category) {
      EraseLocked(it);
      ++erased;
    }
    it = next;
  }
  RebuildIndexLocked();
  return erased;
}

size_t HotTier::ErasePrefix(const std::string& prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t erased = 0;
  for (auto it = lru_.begin(); it != lru_.end();) {
    auto next = std::next(it);
    if (it->entry.key.compare(0, prefix.size(), prefix) == 0) {
      EraseLocked(it);
      ++erased;
    }
    it = next;
  }
  return erased;
}

size_t HotTier::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lru_.size();
}

uint64_t HotTier::GetEvictions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return evictions_;
}

uint64_t HotTier::GetIndexFallbacks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_fallbacks_;
}

bool HotTier::IsIndexConsistent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return IndexConsistentLocked();
}

void HotTier::IndexLocked(Node& node) {
  const auto& category = node.entry.category;
  if (category.empty() || overflowed_categories_.count(category) > 0) {
    node.indexed = false;
    ++unindexed_count_;
    return;
  }
  auto& keys = category_index_[category];
  if (keys.size() >= max_category_index_size_) {
    SPDLOG_WARN("HotTier: category {} exceeded {} indexed keys, no longer indexed",
                category, max_category_index_size_);
    overflowed_categories_.insert(category);
    node.indexed = false;
    ++unindexed_count_;
    return;
  }
  keys.insert(node.entry.key);
  node.indexed = true;
  ++indexed_count_;
}

void HotTier::UnindexLocked(const Node& node) {
  if (!node.indexed) {
    if (unindexed_count_ > 0) {
      --unindexed_count_;
    }
    return;
  }
  auto it = category_index_.find(node.entry.category);
  if (it != category_index_.end() && it->second.erase(node.entry.key) > 0) {
    --indexed_count_;
    if (it->second.empty()) {
      category_index_.erase(it);
    }
  }
}

void HotTier::EraseLocked(LruList::iterator it) {
  UnindexLocked(*it);
  entries_.erase(it->entry.key);
  lru_.erase(it);
}

bool HotTier::IndexConsistentLocked() const {
  return indexed_count_ + unindexed_count_ == lru_.size() && entries_.size() == lru_.size();
}

void HotTier::RebuildIndexLocked() {
  category_index_.clear();
  overflowed_categories_.clear();
  indexed_count_ = 0;
  unindexed_count_ = 0;
  for (auto& node : lru_) {
    IndexLocked(node);
  }
}

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
