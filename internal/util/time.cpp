#include "time.hpp"

#include <limits>

namespace workledger::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

namespace {

constexpr uint64_t kMaxMillis = std::numeric_limits<uint64_t>::max();

uint64_t ScaleSaturating(uint64_t value, uint64_t factor) {
  if (value > kMaxMillis / factor) return kMaxMillis;
  return value * factor;
}

} // namespace

uint64_t SecondsToMillis(uint64_t seconds) {
  return ScaleSaturating(seconds, 1000);
}

uint64_t DaysToMillis(uint64_t days) {
  return ScaleSaturating(days, 24ull * 3600 * 1000);
}

uint64_t AddMillis(uint64_t base_ms, uint64_t delta_ms) {
  return delta_ms > kMaxMillis - base_ms ? kMaxMillis : base_ms + delta_ms;
}

} // namespace workledger::util
