/*
  FlowPredictor interface: abstracts the external flow model.

  The forecast cache only sees predict_all(); whether values come from a
  trained regressor, a rule-based baseline or a test double is invisible to
  the weight function and path engine.

  For Python developers:
  - virtual ... = 0: pure virtual (like @abstractmethod)
  - std::function<R(A)>: any callable (like typing.Callable[[A], R])
*/
#pragma once

#include <array>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include "pathcast/core/constants.hpp"
#include "pathcast/core/graph_store.hpp"
#include "pathcast/core/time_context.hpp"
#include "pathcast/core/types.hpp"

namespace pathcast::core {

class FlowPredictor {
public:
  virtual ~FlowPredictor() noexcept = default;

  // One predicted flow per edge, in EdgeIndex order (size == g.num_edges()).
  // Must be a pure function of (ctx, g). May throw on model failure.
  [[nodiscard]] virtual std::vector<Flow> predict_all(const TimeContext& ctx,
                                                      const GraphStore& g) const = 0;
};

using FlowPredictorPtr = std::shared_ptr<const FlowPredictor>;

// Per-edge form of the contract.
using EdgeFlowFn = std::function<Flow(const TimeContext&, const Edge&)>;

[[nodiscard]] FlowPredictorPtr make_function_predictor(EdgeFlowFn fn);

// Rule-based baseline: 0.25*cap + (peak ? 0.4 : 0.1)*cap + 0.05*cap*hour/24.
[[nodiscard]] FlowPredictorPtr make_baseline_predictor();
[[nodiscard]] Flow baseline_flow(const TimeContext& ctx, Cap capacity) noexcept;

// Feature row layout expected by the trained flow models.
inline constexpr std::array<std::string_view, 7> kFeatureNames {
    "hour", "day_of_week", "is_peak", "capacity", "length_m", "flow_lag1", "flow_lag2"};
inline constexpr std::size_t kNumFeatures = kFeatureNames.size();
using FeatureRow = std::array<double, kNumFeatures>;

struct FeatureOptions {
  // Lag features are not observed at query time; both are set to this
  // fraction of the edge capacity.
  double lag_fraction {kDefaultLagFraction};
};

// One feature row per edge in EdgeIndex order.
[[nodiscard]] std::vector<FeatureRow> build_feature_rows(const GraphStore& g,
                                                         const TimeContext& ctx,
                                                         const FeatureOptions& opts = {});

} // namespace pathcast::core
