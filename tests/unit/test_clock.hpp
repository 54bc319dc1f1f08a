#pragma once

#include "engine/common/time_source.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

namespace mdstream {
namespace test {

// Manually advanced steady and wall clocks sharing one offset
class ManualClock {
 public:
  ManualClock()
      : steady_(engine::common::SteadyClock::time_point() + std::chrono::hours(1)),
        wall_(engine::common::FromEpochMillis(1767225600000)) {}  // 2026-01-01T00:00:00Z

  explicit ManualClock(engine::common::WallClock::time_point wall)
      : steady_(engine::common::SteadyClock::time_point() + std::chrono::hours(1)), wall_(wall) {}

  void Advance(std::chrono::milliseconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    steady_ += delta;
    wall_ += delta;
  }

  void SetWall(engine::common::WallClock::time_point wall) {
    std::lock_guard<std::mutex> lock(mutex_);
    wall_ = wall;
  }

  engine::common::SteadyClock::time_point Steady() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return steady_;
  }

  engine::common::WallClock::time_point Wall() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wall_;
  }

  engine::common::TimeSource Source() {
    return [this]() { return Steady(); };
  }

  engine::common::WallTimeSource WallSource() {
    return [this]() { return Wall(); };
  }

 private:
  mutable std::mutex mutex_;
  engine::common::SteadyClock::time_point steady_;
  engine::common::WallClock::time_point wall_;
};

// Poll predicate until true or timeout (for state driven by worker threads)
inline bool WaitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return predicate();
}

}  // namespace test
}  // namespace mdstream
