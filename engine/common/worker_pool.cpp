#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace mdstream {
namespace engine {
namespace common {

WorkerPool::WorkerPool(std::string name, size_t thread_count, size_t max_queue_depth)
    : name_(std::move(name)),
      thread_count_(std::max<size_t>(1, thread_count)),
      max_queue_depth_(max_queue_depth) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

size_t WorkerPool::DefaultThreadCount(size_t min_threads, size_t max_threads) {
  size_t hw = std::thread::hardware_concurrency();
  if (hw == 0) {
    hw = min_threads;
  }
  return std::clamp(hw, min_threads, std::max(min_threads, max_threads));
}

void WorkerPool::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drain_on_stop_ = false;
  }
  workers_.reserve(thread_count_);
  for (size_t i = 0; i < thread_count_; ++i) {
    workers_.emplace_back(&WorkerPool::WorkerLoop, this, i);
  }
  SPDLOG_DEBUG("WorkerPool[{}]: started {} workers", name_, thread_count_);
}

void WorkerPool::Stop(bool drain) {
  if (!running_.exchange(false)) {
    return;
  }

  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drain_on_stop_ = drain;
    if (!drain) {
      dropped = queue_.size();
      queue_.clear();
    }
  }
  cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  idle_cv_.notify_all();

  if (dropped > 0) {
    SPDLOG_INFO("WorkerPool[{}]: stopped, dropped {} pending tasks", name_, dropped);
  } else {
    SPDLOG_DEBUG("WorkerPool[{}]: stopped", name_);
  }
}

bool WorkerPool::Submit(std::function<void()> task) {
  if (!running_.load()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_queue_depth_ > 0 && queue_.size() >= max_queue_depth_) {
      SPDLOG_WARN("WorkerPool[{}]: queue full ({}), rejecting task", name_, queue_.size());
      return false;
    }
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

bool WorkerPool::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] {
    return queue_.empty() && active_.load() == 0;
  });
}

size_t WorkerPool::GetQueueDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void WorkerPool::WorkerLoop(size_t index) {
  SPDLOG_TRACE("WorkerPool[{}]: worker {} running", name_, index);
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
      if (queue_.empty() || (!running_.load() && !drain_on_stop_)) {
        if (!running_.load()) {
          break;
        }
        continue;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
      active_.fetch_add(1);
    }

    try {
      task();
    } catch (const std::exception& e) {
      SPDLOG_ERROR("WorkerPool[{}]: task exception: {}", name_, e.what());
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      active_.fetch_sub(1);
      if (queue_.empty() && active_.load() == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

}  // namespace common
}  // namespace engine
}  // namespace mdstream
