#include "pathcast/core/types.hpp"

#include <string>

#include "pathcast/core/error.hpp"

namespace pathcast::core {

RouteMode parse_route_mode(std::string_view s) {
  if (s == "distance") return RouteMode::Distance;
  if (s == "penalized") return RouteMode::Penalized;
  if (s == "both") return RouteMode::Both;
  throw ValueError("unknown route mode '" + std::string(s) + "' (expected distance, penalized or both)");
}

std::string_view to_string(RouteMode mode) noexcept {
  switch (mode) {
    case RouteMode::Distance: return "distance";
    case RouteMode::Penalized: return "penalized";
    case RouteMode::Both: return "both";
  }
  return "unknown";
}

std::string_view to_string(CongestionLevel level) noexcept {
  switch (level) {
    case CongestionLevel::Low: return "low";
    case CongestionLevel::Medium: return "medium";
    case CongestionLevel::High: return "high";
  }
  return "unknown";
}

} // namespace pathcast::core
