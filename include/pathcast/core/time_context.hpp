/* Discretized forecast key: (hour, day_of_week, is_peak). */
#pragma once

#include <cstddef>
#include <string>

namespace pathcast::core {

struct TimeContext {
  int hour {0};          // [0, 23]
  int day_of_week {0};   // [0, 6], 0 = Monday
  bool is_peak {false};

  // Builds a context with is_peak derived from the campus peak hours.
  [[nodiscard]] static TimeContext from_hour(int hour, int day_of_week);
  // Inverse of index().
  [[nodiscard]] static TimeContext from_index(std::size_t index);

  // Throws ValueError if any field is out of range.
  void validate() const;
  // Dense key in [0, kNumTimeContexts). Requires a valid context.
  [[nodiscard]] std::size_t index() const noexcept {
    return (static_cast<std::size_t>(hour) * 7 + static_cast<std::size_t>(day_of_week)) * 2 +
           (is_peak ? 1u : 0u);
  }
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const TimeContext& a, const TimeContext& b) noexcept {
    return a.hour == b.hour && a.day_of_week == b.day_of_week && a.is_peak == b.is_peak;
  }
};

[[nodiscard]] bool is_peak_hour(int hour) noexcept;

} // namespace pathcast::core
