#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace mdstream {
namespace engine {
namespace common {

using SteadyClock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

// Injectable clocks. Components take these so timer-driven logic can be
// driven deterministically in tests.
using TimeSource = std::function<SteadyClock::time_point()>;
using WallTimeSource = std::function<WallClock::time_point()>;

inline TimeSource DefaultTimeSource() {
  return [] { return SteadyClock::now(); };
}

inline WallTimeSource DefaultWallTimeSource() {
  return [] { return WallClock::now(); };
}

inline int64_t ToEpochMillis(WallClock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline WallClock::time_point FromEpochMillis(int64_t ms) {
  return WallClock::time_point(std::chrono::milliseconds(ms));
}

}  // namespace common
}  // namespace engine
}  // namespace mdstream
