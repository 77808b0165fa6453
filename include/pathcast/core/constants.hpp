/* Numeric constants shared by the forecast and routing layers. */
#pragma once

#include <array>
#include <cstddef>

namespace pathcast::core {

// Relative tolerance used when comparing accumulated path costs for ties.
inline constexpr double kCostEpsilon = 1e-9;

// Capacity floor used in ratio = pred_flow / max(capacity, floor).
inline constexpr double kCapacityFloor = 1.0;

// Default congestion weight (alpha) for penalized routing.
inline constexpr double kDefaultCongestionWeight = 1.0;

// Average walking speed used for walk_min estimates.
inline constexpr double kDefaultWalkingSpeedMps = 1.3;

// Congestion tiers: ratio < kMediumRatio is low, < kHighRatio is medium.
inline constexpr double kMediumRatio = 0.5;
inline constexpr double kHighRatio = 0.8;
// Penalty terms applied per tier by PenaltyModel::Stepped.
inline constexpr std::array<double, 3> kTierPenalty {0.0, 0.3, 0.7};

// Time context key space: 24 hours x 7 days x peak flag.
inline constexpr int kHoursPerDay = 24;
inline constexpr int kDaysPerWeek = 7;
inline constexpr std::size_t kNumTimeContexts = 24 * 7 * 2;

// Campus class-change hours treated as peak.
inline constexpr std::array<int, 7> kPeakHours {8, 9, 10, 13, 14, 15, 16};

// Lag features passed to flow models default to this fraction of capacity.
inline constexpr double kDefaultLagFraction = 0.1;

} // namespace pathcast::core
