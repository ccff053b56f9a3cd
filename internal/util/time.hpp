#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace fabplan::util {

/*
  Clock source and deadline helpers.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Injectable clock; tests substitute a manual one.
using NowFn = std::function<TimePoint()>;

TimePoint Now();

// Deadline `budget_ms` from `now`, or nullopt when the budget is zero.
std::optional<TimePoint> DeadlineAfter(TimePoint now, std::uint64_t budget_ms);

bool Expired(const std::optional<TimePoint>& deadline, TimePoint now);

} // namespace fabplan::util
