/* Bounded per-time-context forecast cache with at-most-once computation. */
#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "pathcast/core/constants.hpp"
#include "pathcast/core/flow_predictor.hpp"
#include "pathcast/core/graph_store.hpp"
#include "pathcast/core/time_context.hpp"
#include "pathcast/core/types.hpp"

namespace pathcast::core {

struct EdgeForecast {
  EdgeIndex edge {-1};
  Flow pred_flow {0.0};
  Cap capacity {0.0};
  double ratio {0.0};  // pred_flow / max(capacity, kCapacityFloor)
};

// Point-in-time snapshot for one TimeContext. Never mutated once published.
struct ForecastEntry {
  TimeContext context {};
  std::vector<EdgeForecast> edges;  // EdgeIndex order

  // Congestion ratio of edge e, or 0 when the edge is not covered.
  [[nodiscard]] double ratio(EdgeIndex e) const noexcept {
    if (e < 0 || static_cast<std::size_t>(e) >= edges.size()) return 0.0;
    return edges[static_cast<std::size_t>(e)].ratio;
  }
};

[[nodiscard]] double congestion_ratio(Flow pred_flow, Cap capacity) noexcept;
[[nodiscard]] CongestionLevel congestion_level(double ratio) noexcept;

// ForecastCache maps every possible TimeContext to a lazily computed
// ForecastEntry. The key space is fixed (kNumTimeContexts slots), so the
// cache never evicts and never grows past it.
//
// Concurrency: each slot has its own mutex. The first caller for a key runs
// the predictor under that slot's lock; concurrent callers for the same key
// wait and then share the stored entry. Populated slots are read without
// locking. If the predictor fails nothing is stored and a later call retries.
class ForecastCache {
public:
  ForecastCache(std::shared_ptr<const GraphStore> graph, FlowPredictorPtr predictor);
  ForecastCache(const ForecastCache&) = delete;
  ForecastCache& operator=(const ForecastCache&) = delete;

  // Returns the cached entry for ctx, computing it on first request. Also
  // marks it as the active forecast. Throws ValueError for an invalid ctx,
  // PredictionError if the predictor fails or returns unusable values.
  [[nodiscard]] std::shared_ptr<const ForecastEntry> get_or_compute(const TimeContext& ctx);

  // Stored entry for ctx or nullptr; never computes.
  [[nodiscard]] std::shared_ptr<const ForecastEntry> peek(const TimeContext& ctx) const;

  // Entry most recently returned by get_or_compute, or nullptr.
  [[nodiscard]] std::shared_ptr<const ForecastEntry> active() const;

  [[nodiscard]] std::size_t size() const noexcept { return size_.load(std::memory_order_acquire); }
  [[nodiscard]] std::uint64_t computations() const noexcept { return computations_.load(std::memory_order_acquire); }
  [[nodiscard]] const GraphStore& graph() const noexcept { return *graph_; }

private:
  struct Slot {
    std::mutex mutex;
    std::atomic<bool> ready {false};
    std::shared_ptr<const ForecastEntry> entry;  // written once before ready
  };

  [[nodiscard]] std::shared_ptr<const ForecastEntry> compute(const TimeContext& ctx);

  std::shared_ptr<const GraphStore> graph_;
  FlowPredictorPtr predictor_;
  std::array<Slot, kNumTimeContexts> slots_ {};
  std::atomic<int> active_ {-1};
  std::atomic<std::size_t> size_ {0};
  std::atomic<std::uint64_t> computations_ {0};
};

} // namespace pathcast::core
