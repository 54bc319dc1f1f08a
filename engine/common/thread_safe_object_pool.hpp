#pragma once

#include <boost/pool/object_pool.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <type_traits>

namespace mdstream {
namespace engine {
namespace common {

/**
 * @brief Thread-safe object pool over boost::object_pool
 *
 * Hands out move-only RAII handles; the object is cleared and returned to
 * the pool when the handle is destroyed. T must be default-constructible and
 * expose Clear() (protobuf messages do).
 */
template <typename T>
class ThreadSafeObjectPool : public std::enable_shared_from_this<ThreadSafeObjectPool<T>> {
 public:
  /** @brief RAII handle to a pooled object */
  class PooledObject {
   public:
    PooledObject() = default;

    PooledObject(std::shared_ptr<ThreadSafeObjectPool<T>> pool, T* ptr)
        : pool_(std::move(pool)), ptr_(ptr) {}

    ~PooledObject() { Release(); }

    PooledObject(const PooledObject&) = delete;
    PooledObject& operator=(const PooledObject&) = delete;

    PooledObject(PooledObject&& other) noexcept
        : pool_(std::move(other.pool_)), ptr_(other.ptr_) {
      other.ptr_ = nullptr;
    }

    PooledObject& operator=(PooledObject&& other) noexcept {
      if (this != &other) {
        Release();
        pool_ = std::move(other.pool_);
        ptr_ = other.ptr_;
        other.ptr_ = nullptr;
      }
      return *this;
    }

    T* get() { return ptr_; }
    const T* get() const { return ptr_; }
    T* operator->() { return ptr_; }
    const T* operator->() const { return ptr_; }
    T& operator*() { return *ptr_; }
    const T& operator*() const { return *ptr_; }
    explicit operator bool() const { return ptr_ != nullptr; }

   private:
    void Release() {
      if (ptr_ && pool_) {
        pool_->Return(ptr_);
      }
      ptr_ = nullptr;
    }

    std::shared_ptr<ThreadSafeObjectPool<T>> pool_;
    T* ptr_ = nullptr;
  };

  /** @brief Acquire a cleared object from the pool */
  PooledObject Acquire() {
    T* ptr = nullptr;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ptr = pool_.construct();
    }
    if (ptr) {
      outstanding_.fetch_add(1);
    }
    return PooledObject(this->shared_from_this(), ptr);
  }

  /** @brief Objects currently handed out */
  size_t GetOutstanding() const { return outstanding_.load(); }

  /** @brief Release pooled memory not currently in use */
  void ReleaseMemory() {
    std::lock_guard<std::mutex> lock(mutex_);
    pool_.release_memory();
  }

 private:
  void Return(T* ptr) {
    ptr->Clear();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pool_.destroy(ptr);
    }
    outstanding_.fetch_sub(1);
  }

  boost::object_pool<T> pool_;
  std::atomic<size_t> outstanding_{0};
  mutable std::mutex mutex_;
};

/** @brief Process-wide pool for type T */
template <typename T>
std::shared_ptr<ThreadSafeObjectPool<T>> GetThreadSafeObjectPool() {
  static auto pool = std::make_shared<ThreadSafeObjectPool<T>>();
  return pool;
}

}  // namespace common
}  // namespace engine
}  // namespace mdstream
