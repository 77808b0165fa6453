/* Core type aliases and small enums shared across the routing engine.
 *
 * For Python developers:
 * - NodeIndex/EdgeIndex: int32 dense indices (string ids live in GraphStore)
 * - Cost/Flow/Cap: double (matches np.float64)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace pathcast::core {

// Dense node and edge indices assigned by GraphStore at load time.
using NodeIndex = std::int32_t;
using EdgeIndex = std::int32_t;
using Cost = double;  // Routing cost (metres, possibly penalized)
using Cap  = double;  // Edge capacity (pedestrians per interval)
using Flow = double;  // Predicted flow (same unit as capacity)

// Weight function applied to edges during a single path search.
enum class WeightMode {
  Distance = 1,   // cost = length_m
  Penalized = 2   // cost = length_m * (1 + alpha * penalty(ratio))
};

// Route query mode. Both runs the path engine once per weight mode.
enum class RouteMode {
  Distance = 1,
  Penalized = 2,
  Both = 3
};

// How a congestion ratio is turned into a penalty term.
enum class PenaltyModel {
  Linear = 1,   // penalty = ratio
  Stepped = 2   // penalty = tier penalty of congestion_level(ratio)
};

// Coarse congestion tiers by ratio (low < 0.5 <= medium < 0.8 <= high).
enum class CongestionLevel {
  Low = 0,
  Medium = 1,
  High = 2
};

[[nodiscard]] inline constexpr bool includes(RouteMode mode, WeightMode w) noexcept {
  if (mode == RouteMode::Both) return true;
  return (w == WeightMode::Distance) ? mode == RouteMode::Distance
                                     : mode == RouteMode::Penalized;
}

// Parses "distance", "penalized" or "both"; throws ValueError otherwise.
[[nodiscard]] RouteMode parse_route_mode(std::string_view s);
[[nodiscard]] std::string_view to_string(RouteMode mode) noexcept;
[[nodiscard]] std::string_view to_string(CongestionLevel level) noexcept;

} // namespace pathcast::core
