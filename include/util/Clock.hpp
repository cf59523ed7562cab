#pragma once

#include <chrono>
#include <cstdint>

namespace skynode::util {

// Wall-clock instants: samples, alerts and peer heartbeats all cross the wire
// as epoch milliseconds.
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Largest epoch-ms value whose nanosecond time_point does not overflow.
inline constexpr int64_t kMaxEpochMs = 9'000'000'000'000LL;

[[nodiscard]] inline int64_t to_epoch_ms(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline TimePoint from_epoch_ms(int64_t ms) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

[[nodiscard]] inline int64_t now_epoch_ms() { return to_epoch_ms(Clock::now()); }

} // namespace skynode::util
