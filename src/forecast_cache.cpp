/*
  ForecastCache: lock-per-key lazy forecast population.

  Publication protocol per slot: the writer stores `entry` and then sets
  `ready` with release ordering; readers that observe `ready` with acquire
  ordering may copy `entry` without the lock because it is never written
  again.
*/
#include "pathcast/core/forecast_cache.hpp"

#include <algorithm>
#include <cmath>

#include "pathcast/core/error.hpp"
#include "pathcast/core/logging.hpp"

namespace pathcast::core {

double congestion_ratio(Flow pred_flow, Cap capacity) noexcept {
  return pred_flow / std::max(capacity, kCapacityFloor);
}

CongestionLevel congestion_level(double ratio) noexcept {
  if (ratio < kMediumRatio) return CongestionLevel::Low;
  if (ratio < kHighRatio) return CongestionLevel::Medium;
  return CongestionLevel::High;
}

ForecastCache::ForecastCache(std::shared_ptr<const GraphStore> graph, FlowPredictorPtr predictor)
    : graph_(std::move(graph)), predictor_(std::move(predictor)) {
  if (!graph_) throw ValueError("ForecastCache: graph must not be null");
  if (!predictor_) throw ValueError("ForecastCache: predictor must not be null");
}

std::shared_ptr<const ForecastEntry> ForecastCache::get_or_compute(const TimeContext& ctx) {
  ctx.validate();
  const auto key = ctx.index();
  Slot& slot = slots_[key];
  if (!slot.ready.load(std::memory_order_acquire)) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (!slot.ready.load(std::memory_order_relaxed)) {
      // compute() throws on failure, leaving the slot empty
      slot.entry = compute(ctx);
      slot.ready.store(true, std::memory_order_release);
      size_.fetch_add(1, std::memory_order_acq_rel);
    } else {
      logger()->debug("forecast {} computed by a concurrent request", ctx.to_string());
    }
  }
  active_.store(static_cast<int>(key), std::memory_order_release);
  return slot.entry;
}

std::shared_ptr<const ForecastEntry> ForecastCache::peek(const TimeContext& ctx) const {
  ctx.validate();
  const Slot& slot = slots_[ctx.index()];
  if (!slot.ready.load(std::memory_order_acquire)) return nullptr;
  return slot.entry;
}

std::shared_ptr<const ForecastEntry> ForecastCache::active() const {
  const int key = active_.load(std::memory_order_acquire);
  if (key < 0) return nullptr;
  // active_ is only set after the slot was published
  return slots_[static_cast<std::size_t>(key)].entry;
}

std::shared_ptr<const ForecastEntry> ForecastCache::compute(const TimeContext& ctx) {
  const GraphStore& g = *graph_;
  std::vector<Flow> flows;
  try {
    flows = predictor_->predict_all(ctx, g);
  } catch (const PredictionError&) {
    throw;
  } catch (const std::exception& ex) {
    throw PredictionError("flow prediction failed for " + ctx.to_string() + ": " + ex.what());
  }
  if (flows.size() != static_cast<std::size_t>(g.num_edges())) {
    throw PredictionError("predictor returned " + std::to_string(flows.size()) +
                          " values for " + std::to_string(g.num_edges()) + " edges");
  }

  auto entry = std::make_shared<ForecastEntry>();
  entry->context = ctx;
  entry->edges.reserve(flows.size());
  auto cap = g.capacity_view();
  std::size_t clamped = 0;
  for (std::size_t i = 0; i < flows.size(); ++i) {
    Flow f = flows[i];
    if (!std::isfinite(f)) {
      throw PredictionError("predictor returned non-finite flow for edge '" +
                            g.edge(static_cast<EdgeIndex>(i)).id + "'");
    }
    if (f < 0.0) { f = 0.0; ++clamped; }
    entry->edges.push_back(EdgeForecast{static_cast<EdgeIndex>(i), f, cap[i], congestion_ratio(f, cap[i])});
  }
  if (clamped > 0) {
    logger()->warn("forecast {}: clamped {} negative predictions to 0", ctx.to_string(), clamped);
  }
  computations_.fetch_add(1, std::memory_order_acq_rel);
  logger()->info("forecast computed for {} over {} edges", ctx.to_string(), entry->edges.size());
  return entry;
}

} // namespace pathcast::core
