#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace workledger::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injected where tests need to move time around (lease expiry).
using NowFn = std::function<TimePoint()>;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Conversions and addition clamp at UINT64_MAX instead of wrapping.
uint64_t SecondsToMillis(uint64_t seconds);
uint64_t DaysToMillis(uint64_t days);
uint64_t AddMillis(uint64_t base_ms, uint64_t delta_ms);

} // namespace workledger::util
