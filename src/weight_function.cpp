#include "pathcast/core/weight_function.hpp"

#include <cmath>
#include <string>

#include "pathcast/core/error.hpp"

namespace pathcast::core {

void WeightOptions::validate() const {
  if (!std::isfinite(congestion_weight) || congestion_weight < 0.0) {
    throw ValueError("congestion_weight must be finite and >= 0, got " + std::to_string(congestion_weight));
  }
}

double congestion_penalty(double ratio, PenaltyModel model) noexcept {
  if (model == PenaltyModel::Stepped) {
    return kTierPenalty[static_cast<std::size_t>(congestion_level(ratio))];
  }
  return ratio;
}

Cost edge_weight(const GraphStore& g, EdgeIndex e, WeightMode mode,
                 const ForecastEntry* forecast, const WeightOptions& opts) {
  const double length = g.edge(e).length_m;
  if (mode == WeightMode::Distance) return length;
  if (!forecast) throw ForecastNotReady();
  return length * (1.0 + opts.congestion_weight * congestion_penalty(forecast->ratio(e), opts.penalty_model));
}

std::vector<Cost> build_weights(const GraphStore& g, WeightMode mode,
                                const ForecastEntry* forecast, const WeightOptions& opts) {
  opts.validate();
  auto length = g.length_view();
  std::vector<Cost> w(length.begin(), length.end());
  if (mode == WeightMode::Distance) return w;
  if (!forecast) throw ForecastNotReady();
  for (std::size_t i = 0; i < w.size(); ++i) {
    const double pen = congestion_penalty(forecast->ratio(static_cast<EdgeIndex>(i)), opts.penalty_model);
    w[i] *= 1.0 + opts.congestion_weight * pen;
  }
  return w;
}

} // namespace pathcast::core
