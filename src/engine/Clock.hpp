#pragma once

#include <chrono>
#include <functional>

namespace engine
{

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Source of "now" for triggers that do not carry a frame timestamp.
// Tests substitute a manual clock.
using ClockFn = std::function<TimePoint()>;

inline ClockFn systemClock()
{
    return [] { return Clock::now(); };
}

} // namespace engine
