#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mdstream {
namespace engine {
namespace common {

/**
 * @brief Fixed-size pool of worker threads draining a shared FIFO queue
 *
 * Used for blocking work that must not run on an EventThread: handshakes,
 * recovery replays, foreground fetches and background cache refreshes.
 * The queue is bounded so bursts are rejected instead of spawning work.
 */
class WorkerPool {
 public:
  WorkerPool(std::string name, size_t thread_count, size_t max_queue_depth = 0);
  ~WorkerPool();

  // Non-copyable, non-movable
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  /**
   * @brief Stop workers
   * @param drain Run queued tasks before exiting; otherwise they are dropped
   */
  void Stop(bool drain = false);

  /** @brief Queue a task; false if the pool is stopped or the queue is full */
  bool Submit(std::function<void()> task);

  /** @brief Block until the queue is empty and no task is executing */
  bool WaitIdle(std::chrono::milliseconds timeout);

  bool IsRunning() const { return running_.load(); }
  size_t GetQueueDepth() const;
  size_t GetActiveCount() const { return active_.load(); }
  size_t GetThreadCount() const { return thread_count_; }
  const std::string& GetName() const { return name_; }

  /** @brief clamp(hardware_concurrency, min_threads, max_threads) */
  static size_t DefaultThreadCount(size_t min_threads, size_t max_threads);

 private:
  std::string name_;
  size_t thread_count_;
  size_t max_queue_depth_;  // 0 = unbounded
  std::atomic<bool> running_{false};
  std::atomic<size_t> active_{0};
  std::vector<std::thread> workers_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<std::function<void()>> queue_;
  bool drain_on_stop_ = false;

  void WorkerLoop(size_t index);
};

}  // namespace common
}  // namespace engine
}  // namespace mdstream
