#include "time.hpp"

namespace mprisrelay::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

bool WithinWindow(int64_t a_ms, int64_t b_ms, std::chrono::milliseconds window) {
  const auto distance = a_ms >= b_ms ? static_cast<uint64_t>(a_ms) - static_cast<uint64_t>(b_ms)
                                     : static_cast<uint64_t>(b_ms) - static_cast<uint64_t>(a_ms);
  return window.count() >= 0 && distance <= static_cast<uint64_t>(window.count());
}

} // namespace mprisrelay::util
