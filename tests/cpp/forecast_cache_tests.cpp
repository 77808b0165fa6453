#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "pathcast/core/error.hpp"
#include "pathcast/core/forecast_cache.hpp"
#include "test_utils.hpp"

using namespace pathcast::core;
using namespace pathcast::core::test;

namespace {
std::shared_ptr<const GraphStore> diamond() {
  return std::make_shared<const GraphStore>(make_diamond_graph());
}

class FailingPredictor final : public FlowPredictor {
public:
  std::vector<Flow> predict_all(const TimeContext&, const GraphStore& g) const override {
    if (failures_left_.fetch_sub(1) > 0) throw std::runtime_error("model unavailable");
    return std::vector<Flow>(static_cast<std::size_t>(g.num_edges()), 5.0);
  }
  mutable std::atomic<int> failures_left_ {1};
};

class SlowPredictor final : public FlowPredictor {
public:
  std::vector<Flow> predict_all(const TimeContext&, const GraphStore& g) const override {
    calls.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return std::vector<Flow>(static_cast<std::size_t>(g.num_edges()), 1.0);
  }
  mutable std::atomic<int> calls {0};
};
} // namespace

TEST(ForecastCache, MissComputesThenHitReuses) {
  auto stub = std::make_shared<StubPredictor>(std::map<std::string, Flow>{{"AB", 90.0}});
  ForecastCache cache(diamond(), stub);
  const TimeContext ctx {9, 1, true};

  EXPECT_EQ(cache.peek(ctx), nullptr);
  auto first = cache.get_or_compute(ctx);
  auto second = cache.get_or_compute(ctx);

  EXPECT_EQ(stub->calls(), 1);
  EXPECT_EQ(cache.computations(), 1u);
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_EQ(first.get(), second.get());
  EXPECT_EQ(cache.peek(ctx).get(), first.get());
  ASSERT_EQ(first->edges.size(), second->edges.size());
  for (std::size_t i = 0; i < first->edges.size(); ++i) {
    EXPECT_EQ(std::memcmp(&first->edges[i].ratio, &second->edges[i].ratio, sizeof(double)), 0);
  }
}

TEST(ForecastCache, RatioUsesFlooredCapacity) {
  std::vector<Node> nodes {make_node("A"), make_node("B"), make_node("C")};
  std::vector<Edge> edges {make_edge("big", "A", "B", 10.0, 200.0),
                           make_edge("tiny", "B", "C", 10.0, 0.25)};
  auto g = std::make_shared<const GraphStore>(GraphStore::load(nodes, edges));
  auto stub = std::make_shared<StubPredictor>(std::map<std::string, Flow>{{"big", 50.0}, {"tiny", 2.0}});
  ForecastCache cache(g, stub);

  auto f = cache.get_or_compute(TimeContext{10, 3, true});
  ASSERT_EQ(f->edges.size(), 2u);
  EXPECT_DOUBLE_EQ(f->edges[0].ratio, 0.25);
  EXPECT_DOUBLE_EQ(f->edges[0].capacity, 200.0);
  EXPECT_DOUBLE_EQ(f->edges[0].pred_flow, 50.0);
  EXPECT_DOUBLE_EQ(f->edges[1].ratio, 2.0);  // 2 / max(0.25, 1)
  EXPECT_EQ(f->context, (TimeContext{10, 3, true}));
  EXPECT_DOUBLE_EQ(f->ratio(99), 0.0);
}

TEST(ForecastCache, DistinctContextsAreDistinctEntries) {
  auto stub = std::make_shared<StubPredictor>();
  ForecastCache cache(diamond(), stub);
  auto a = cache.get_or_compute(TimeContext{9, 1, true});
  auto b = cache.get_or_compute(TimeContext{9, 1, false});
  EXPECT_NE(a.get(), b.get());
  EXPECT_EQ(stub->calls(), 2);
  EXPECT_EQ(cache.size(), 2u);
}

TEST(ForecastCache, ActiveTracksMostRecentRequest) {
  ForecastCache cache(diamond(), std::make_shared<StubPredictor>());
  EXPECT_EQ(cache.active(), nullptr);
  auto a = cache.get_or_compute(TimeContext{9, 1, true});
  EXPECT_EQ(cache.active().get(), a.get());
  auto b = cache.get_or_compute(TimeContext{18, 5, false});
  EXPECT_EQ(cache.active().get(), b.get());
  (void)cache.get_or_compute(TimeContext{9, 1, true});
  EXPECT_EQ(cache.active().get(), a.get());
}

TEST(ForecastCache, PredictorFailureStoresNothingAndRetries) {
  auto pred = std::make_shared<FailingPredictor>();
  ForecastCache cache(diamond(), pred);
  const TimeContext ctx {8, 0, true};

  EXPECT_THROW((void)cache.get_or_compute(ctx), PredictionError);
  EXPECT_EQ(cache.peek(ctx), nullptr);
  EXPECT_EQ(cache.active(), nullptr);
  EXPECT_EQ(cache.size(), 0u);

  auto entry = cache.get_or_compute(ctx);
  ASSERT_NE(entry, nullptr);
  EXPECT_DOUBLE_EQ(entry->edges[0].pred_flow, 5.0);
  EXPECT_EQ(cache.computations(), 1u);
}

TEST(ForecastCache, RejectsUnusablePredictions) {
  auto unit = make_function_predictor([](const TimeContext&, const Edge&) { return 1.0; });
  auto g = diamond();
  std::vector<Node> nodes {make_node("X"), make_node("Y")};
  std::vector<Edge> edges {make_edge("XY", "X", "Y")};
  auto other = std::make_shared<const GraphStore>(GraphStore::load(nodes, edges));

  // Predictor bound to the wrong edge count
  class FixedSize final : public FlowPredictor {
  public:
    std::vector<Flow> predict_all(const TimeContext&, const GraphStore&) const override { return {1.0}; }
  };
  ForecastCache sized(g, std::make_shared<FixedSize>());
  EXPECT_THROW((void)sized.get_or_compute(TimeContext{1, 1, false}), PredictionError);

  ForecastCache nan_cache(other, make_function_predictor([](const TimeContext&, const Edge&) {
    return std::numeric_limits<double>::quiet_NaN();
  }));
  EXPECT_THROW((void)nan_cache.get_or_compute(TimeContext{1, 1, false}), PredictionError);
  EXPECT_EQ(nan_cache.size(), 0u);

  ForecastCache ok(other, unit);
  EXPECT_EQ(ok.get_or_compute(TimeContext{1, 1, false})->edges.size(), 1u);
}

TEST(ForecastCache, NegativePredictionsClampToZero) {
  ForecastCache cache(diamond(), make_function_predictor([](const TimeContext&, const Edge&) { return -3.0; }));
  auto f = cache.get_or_compute(TimeContext{2, 2, false});
  for (const auto& e : f->edges) {
    EXPECT_DOUBLE_EQ(e.pred_flow, 0.0);
    EXPECT_DOUBLE_EQ(e.ratio, 0.0);
  }
}

TEST(ForecastCache, InvalidContextThrows) {
  auto stub = std::make_shared<StubPredictor>();
  ForecastCache cache(diamond(), stub);
  EXPECT_THROW((void)cache.get_or_compute(TimeContext{25, 0, false}), ValueError);
  EXPECT_EQ(stub->calls(), 0);
}

TEST(ForecastCache, ConcurrentRequestsComputeOnce) {
  auto pred = std::make_shared<SlowPredictor>();
  ForecastCache cache(diamond(), pred);
  const TimeContext ctx {13, 4, true};

  constexpr int kThreads = 8;
  std::vector<std::shared_ptr<const ForecastEntry>> results(kThreads);
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] { results[static_cast<std::size_t>(i)] = cache.get_or_compute(ctx); });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(pred->calls.load(), 1);
  EXPECT_EQ(cache.computations(), 1u);
  for (const auto& r : results) EXPECT_EQ(r.get(), results.front().get());
}

TEST(ForecastCache, CongestionLevels) {
  EXPECT_EQ(congestion_level(0.0), CongestionLevel::Low);
  EXPECT_EQ(congestion_level(0.49), CongestionLevel::Low);
  EXPECT_EQ(congestion_level(0.5), CongestionLevel::Medium);
  EXPECT_EQ(congestion_level(0.79), CongestionLevel::Medium);
  EXPECT_EQ(congestion_level(0.8), CongestionLevel::High);
  EXPECT_EQ(congestion_level(3.0), CongestionLevel::High);
  EXPECT_EQ(to_string(CongestionLevel::Medium), "medium");
}
