#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace mprisrelay::util {

/*
  Wall-clock helpers for trust records and relay proofs. Both are
  exchanged as Unix milliseconds; components that check them take a
  ClockFn so tests can pin the time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// |a_ms - b_ms| <= window, without overflow for hostile inputs.
bool WithinWindow(int64_t a_ms, int64_t b_ms, std::chrono::milliseconds window);

} // namespace mprisrelay::util
