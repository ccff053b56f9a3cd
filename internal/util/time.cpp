#include "time.hpp"

namespace fabplan::util {

TimePoint Now() {
  return Clock::now();
}

std::optional<TimePoint> DeadlineAfter(TimePoint now, std::uint64_t budget_ms) {
  if (budget_ms == 0) {
    return std::nullopt;
  }
  return now + std::chrono::milliseconds(budget_ms);
}

bool Expired(const std::optional<TimePoint>& deadline, TimePoint now) {
  return deadline.has_value() && now > *deadline;
}

} // namespace fabplan::util
