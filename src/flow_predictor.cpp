/*
  Built-in predictors: thin adapters behind the FlowPredictor interface.
*/
#include "pathcast/core/flow_predictor.hpp"

#include "pathcast/core/error.hpp"

namespace pathcast::core {

namespace {
class FunctionPredictor final : public FlowPredictor {
public:
  explicit FunctionPredictor(EdgeFlowFn fn) : fn_(std::move(fn)) {}

  std::vector<Flow> predict_all(const TimeContext& ctx, const GraphStore& g) const override {
    std::vector<Flow> out;
    out.reserve(static_cast<std::size_t>(g.num_edges()));
    for (const auto& e : g.edges()) out.push_back(fn_(ctx, e));
    return out;
  }

private:
  EdgeFlowFn fn_;
};

class BaselinePredictor final : public FlowPredictor {
public:
  std::vector<Flow> predict_all(const TimeContext& ctx, const GraphStore& g) const override {
    auto cap = g.capacity_view();
    std::vector<Flow> out(cap.size());
    for (std::size_t i = 0; i < cap.size(); ++i) out[i] = baseline_flow(ctx, cap[i]);
    return out;
  }
};
} // namespace

FlowPredictorPtr make_function_predictor(EdgeFlowFn fn) {
  if (!fn) throw ValueError("make_function_predictor: empty function");
  return std::make_shared<FunctionPredictor>(std::move(fn));
}

FlowPredictorPtr make_baseline_predictor() {
  return std::make_shared<BaselinePredictor>();
}

Flow baseline_flow(const TimeContext& ctx, Cap capacity) noexcept {
  Flow base = 0.25 * capacity;
  base += (ctx.is_peak ? 0.4 : 0.1) * capacity;
  // afternoon demand runs slightly above morning demand
  base += 0.05 * capacity * (static_cast<double>(ctx.hour) / 24.0);
  return base;
}

std::vector<FeatureRow> build_feature_rows(const GraphStore& g, const TimeContext& ctx,
                                           const FeatureOptions& opts) {
  std::vector<FeatureRow> rows;
  rows.reserve(static_cast<std::size_t>(g.num_edges()));
  for (const auto& e : g.edges()) {
    const double lag = opts.lag_fraction * e.capacity;
    rows.push_back(FeatureRow{static_cast<double>(ctx.hour),
                              static_cast<double>(ctx.day_of_week),
                              ctx.is_peak ? 1.0 : 0.0,
                              e.capacity,
                              e.length_m,
                              lag,
                              lag});
  }
  return rows;
}

} // namespace pathcast::core
