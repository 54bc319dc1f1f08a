#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

namespace mdstream {
namespace engine {
namespace common {

/**
 * @brief RCU (Read-Copy-Update) pointer over C++20 atomic shared_ptr
 *
 * Readers take a lock-free snapshot that stays valid for as long as they hold
 * it. Writers publish a new snapshot; Mutate() serializes copy-on-write
 * updates internally, Update()/Exchange() leave serialization to the caller.
 *
 * Used for read-mostly routing tables (consumer registry, broadcast bus,
 * active delivery strategy) that are read on every tick.
 *
 * @tparam T Snapshot type (copyable when Mutate() is used)
 */
template <typename T>
class RCUPtr {
 public:
  /** @brief Default constructor - creates empty snapshot */
  RCUPtr() : ptr_(std::make_shared<T>()) {}

  /** @brief Constructor with initial snapshot (may be null) */
  explicit RCUPtr(std::shared_ptr<T> initial) : ptr_(std::move(initial)) {}

  // Non-copyable, non-movable (atomic shared_ptr is not movable)
  RCUPtr(const RCUPtr&) = delete;
  RCUPtr& operator=(const RCUPtr&) = delete;
  RCUPtr(RCUPtr&&) = delete;
  RCUPtr& operator=(RCUPtr&&) = delete;

  /** @brief Lock-free read of the current snapshot */
  std::shared_ptr<T> Read() const noexcept {
    return ptr_.load(std::memory_order_acquire);
  }

  std::shared_ptr<T> operator->() const noexcept {
    return Read();
  }

  /** @brief Publish a new snapshot (caller serializes writers) */
  void Update(std::shared_ptr<T> new_ptr) noexcept {
    ptr_.store(std::move(new_ptr), std::memory_order_release);
  }

  /** @brief Publish a new snapshot and return the previous one */
  std::shared_ptr<T> Exchange(std::shared_ptr<T> new_ptr) noexcept {
    return ptr_.exchange(std::move(new_ptr), std::memory_order_acq_rel);
  }

  /**
   * @brief Copy the current snapshot, apply fn to the copy, publish it
   *
   * Concurrent Mutate() calls are serialized so no update is lost.
   * @return Whatever fn returns
   */
  template <typename Fn>
  auto Mutate(Fn&& fn) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = Read();
    auto next = current ? std::make_shared<T>(*current) : std::make_shared<T>();
    if constexpr (std::is_void_v<decltype(fn(*next))>) {
      fn(*next);
      Update(std::move(next));
    } else {
      auto result = fn(*next);
      Update(std::move(next));
      return result;
    }
  }

  explicit operator bool() const noexcept {
    return ptr_.load(std::memory_order_acquire) != nullptr;
  }

 private:
  std::atomic<std::shared_ptr<T>> ptr_;
  std::mutex write_mutex_;
};

}  // namespace common
}  // namespace engine
}  // namespace mdstream
