#include "pathcast/core/time_context.hpp"

#include <algorithm>

#include "pathcast/core/constants.hpp"
#include "pathcast/core/error.hpp"

namespace pathcast::core {

bool is_peak_hour(int hour) noexcept {
  return std::find(kPeakHours.begin(), kPeakHours.end(), hour) != kPeakHours.end();
}

TimeContext TimeContext::from_hour(int hour, int day_of_week) {
  TimeContext ctx {hour, day_of_week, is_peak_hour(hour)};
  ctx.validate();
  return ctx;
}

TimeContext TimeContext::from_index(std::size_t index) {
  if (index >= kNumTimeContexts) {
    throw ValueError("time context index out of range: " + std::to_string(index));
  }
  TimeContext ctx;
  ctx.is_peak = (index % 2) != 0;
  ctx.day_of_week = static_cast<int>((index / 2) % kDaysPerWeek);
  ctx.hour = static_cast<int>(index / 2 / kDaysPerWeek);
  return ctx;
}

void TimeContext::validate() const {
  if (hour < 0 || hour >= kHoursPerDay) {
    throw ValueError("hour must be in [0, 23], got " + std::to_string(hour));
  }
  if (day_of_week < 0 || day_of_week >= kDaysPerWeek) {
    throw ValueError("day_of_week must be in [0, 6], got " + std::to_string(day_of_week));
  }
}

std::string TimeContext::to_string() const {
  return "(hour=" + std::to_string(hour) + ", day_of_week=" + std::to_string(day_of_week) +
         ", is_peak=" + (is_peak ? "1" : "0") + ")";
}

} // namespace pathcast::core
