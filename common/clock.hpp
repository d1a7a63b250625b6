#pragma once

// ============================================================
// clock.hpp -- Injectable monotonic clock
// ============================================================

#include <chrono>
#include <functional>

using SteadyClock = std::chrono::steady_clock;
using TimePoint   = SteadyClock::time_point;
using ClockFn     = std::function<TimePoint()>;

inline ClockFn steady_clock_fn() {
    return [] { return SteadyClock::now(); };
}
