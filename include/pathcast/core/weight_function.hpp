/* Edge cost functions: plain distance and congestion-penalized distance. */
#pragma once

#include <vector>

#include "pathcast/core/constants.hpp"
#include "pathcast/core/forecast_cache.hpp"
#include "pathcast/core/graph_store.hpp"
#include "pathcast/core/types.hpp"

namespace pathcast::core {

struct WeightOptions {
  // alpha: how strongly congestion inflates edge length. Must be finite, >= 0.
  double congestion_weight {kDefaultCongestionWeight};
  PenaltyModel penalty_model {PenaltyModel::Linear};

  // Throws ValueError on an invalid congestion_weight.
  void validate() const;
};

// Penalty term for a congestion ratio under the chosen model (before alpha).
[[nodiscard]] double congestion_penalty(double ratio, PenaltyModel model) noexcept;

// Cost of edge e. Distance ignores the forecast; Penalized reads the edge's
// ratio from the forecast (0 if absent) and requires forecast != nullptr.
[[nodiscard]] Cost edge_weight(const GraphStore& g, EdgeIndex e, WeightMode mode,
                               const ForecastEntry* forecast,
                               const WeightOptions& opts = {});

// Cost of every edge in EdgeIndex order. Throws ForecastNotReady for
// Penalized without a forecast.
[[nodiscard]] std::vector<Cost> build_weights(const GraphStore& g, WeightMode mode,
                                              const ForecastEntry* forecast,
                                              const WeightOptions& opts = {});

} // namespace pathcast::core
