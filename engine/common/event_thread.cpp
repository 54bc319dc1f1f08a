#include "event_thread.hpp"
#include <spdlog/spdlog.h>

namespace mdstream {
namespace engine {
namespace common {

//==============================================================================
// Lifecycle
//==============================================================================

EventThread::EventThread(std::string name) : name_(std::move(name)) {
}

EventThread::~EventThread() {
  Stop();
}

//==============================================================================
// Thread control
//==============================================================================

void EventThread::Start() {
  if (running_.exchange(true)) {
    return;  // Already running
  }
  thread_ = std::thread(&EventThread::Run, this);
}

bool EventThread::Stop(uint32_t timeout_ms) {
  if (!running_.exchange(false)) {
    return true;  // Already stopped
  }

  cv_.notify_all();

  if (!thread_.joinable()) {
    return true;
  }

  if (IsCurrentThread()) {
    // Stopped from one of its own tasks; the loop exits after this task.
    thread_.detach();
    return true;
  }

  if (timeout_ms == 0) {
    thread_.join();
    SPDLOG_DEBUG("EventThread[{}]: stopped", name_);
    return true;
  }

  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (thread_id_.load() != std::thread::id()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      SPDLOG_WARN("EventThread[{}]: stop timeout after {}ms", name_, timeout_ms);
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  thread_.join();
  SPDLOG_DEBUG("EventThread[{}]: stopped", name_);
  return true;
}

//==============================================================================
// Task posting
//==============================================================================

void EventThread::Post(std::function<void()> task) {
  if (!running_.load()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    task_queue_.push(std::move(task));
  }
  cv_.notify_one();
}

int EventThread::PostDelayed(std::function<void()> task, std::chrono::milliseconds delay) {
  if (!running_.load()) {
    return -1;
  }

  DelayedTask delayed_task;
  delayed_task.id = next_task_id_.fetch_add(1);
  delayed_task.task = std::move(task);
  delayed_task.execute_at = std::chrono::steady_clock::now() + delay;
  int id = delayed_task.id;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    delayed_tasks_.push(std::move(delayed_task));
  }
  cv_.notify_one();
  return id;
}

void EventThread::CancelDelayed(int task_id) {
  if (task_id < 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_tasks_.insert(task_id);
}

int EventThread::SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval) {
  if (!running_.load()) {
    return -1;
  }

  PeriodicTask periodic_task;
  periodic_task.id = next_task_id_.fetch_add(1);
  periodic_task.task = std::move(task);
  periodic_task.interval = interval;
  periodic_task.next_run = std::chrono::steady_clock::now() + interval;
  int id = periodic_task.id;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    periodic_tasks_.push(std::move(periodic_task));
  }
  cv_.notify_one();
  return id;
}

void EventThread::CancelPeriodic(int task_id) {
  CancelDelayed(task_id);
}

//==============================================================================
// Monitoring
//==============================================================================

size_t EventThread::GetQueueDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return task_queue_.size() + delayed_tasks_.size() + periodic_tasks_.size();
}

//==============================================================================
// Event loop (protected)
//==============================================================================

void EventThread::Run() {
  thread_id_.store(std::this_thread::get_id());
  SPDLOG_DEBUG("EventThread[{}]: loop started", name_);

  while (running_.load()) {
    ProcessTasks();

    std::unique_lock<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    auto next_wake = now + std::chrono::milliseconds(100);

    if (!delayed_tasks_.empty() && delayed_tasks_.top().execute_at < next_wake) {
      next_wake = delayed_tasks_.top().execute_at;
    }
    if (!periodic_tasks_.empty() && periodic_tasks_.top().next_run < next_wake) {
      next_wake = periodic_tasks_.top().next_run;
    }

    if (task_queue_.empty() && delayed_tasks_.empty() && periodic_tasks_.empty()) {
      cv_.wait(lock, [this] {
        return !running_.load() || !task_queue_.empty() ||
               !delayed_tasks_.empty() || !periodic_tasks_.empty();
      });
    } else if (next_wake > now && task_queue_.empty()) {
      cv_.wait_until(lock, next_wake, [this] {
        return !running_.load() || !task_queue_.empty();
      });
    }
  }

  // Immediate tasks posted before Stop() still run; timers are dropped.
  ProcessTasks();
  thread_id_.store(std::thread::id());
}

void EventThread::ProcessTasks() {
  // Immediate tasks
  while (true) {
    std::function<void()> task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (task_queue_.empty()) {
        break;
      }
      task = std::move(task_queue_.front());
      task_queue_.pop();
    }

    try {
      task();
    } catch (const std::exception& e) {
      SPDLOG_ERROR("EventThread[{}]: task exception: {}", name_, e.what());
    }
  }

  auto now = std::chrono::steady_clock::now();

  // Delayed tasks that are due
  while (true) {
    std::function<void()> task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (delayed_tasks_.empty() || delayed_tasks_.top().execute_at > now) {
        break;
      }
      DelayedTask delayed = delayed_tasks_.top();
      delayed_tasks_.pop();
      if (cancelled_tasks_.erase(delayed.id) > 0) {
        continue;
      }
      task = std::move(delayed.task);
    }

    try {
      task();
    } catch (const std::exception& e) {
      SPDLOG_ERROR("EventThread[{}]: delayed task exception: {}", name_, e.what());
    }
  }

  // Periodic tasks that are due
  while (true) {
    std::function<void()> task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (periodic_tasks_.empty() || periodic_tasks_.top().next_run > now) {
        break;
      }

      PeriodicTask periodic = periodic_tasks_.top();
      periodic_tasks_.pop();
      if (cancelled_tasks_.erase(periodic.id) > 0) {
        continue;
      }

      task = periodic.task;
      periodic.next_run = now + periodic.interval;
      periodic_tasks_.push(std::move(periodic));
    }

    try {
      task();
    } catch (const std::exception& e) {
      SPDLOG_ERROR("EventThread[{}]: periodic task exception: {}", name_, e.what());
    }
  }
}

}  // namespace common
}  // namespace engine
}  // namespace mdstream
