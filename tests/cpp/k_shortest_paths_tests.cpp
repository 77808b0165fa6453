#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <limits>
#include <set>
#include <utility>
#include <vector>
#include "pathcast/core/error.hpp"
#include "pathcast/core/k_shortest_paths.hpp"
#include "pathcast/core/shortest_paths.hpp"
#include "pathcast/core/weight_function.hpp"
#include "test_utils.hpp"

using namespace pathcast::core;
using namespace pathcast::core::test;

namespace {
// Every simple s-t path ordered by (cost, node sequence), by exhaustive DFS.
std::vector<std::pair<Cost, std::vector<NodeIndex>>>
all_simple_paths(const GraphStore& g, NodeIndex s, NodeIndex t, const std::vector<Cost>& w) {
  std::vector<std::pair<Cost, std::vector<NodeIndex>>> out;
  std::vector<NodeIndex> stack {s};
  std::vector<bool> on_path(static_cast<std::size_t>(g.num_nodes()), false);
  on_path[static_cast<std::size_t>(s)] = true;
  std::function<void(NodeIndex, Cost)> dfs = [&](NodeIndex u, Cost c) {
    if (u == t) { out.emplace_back(c, stack); return; }
    for (const auto& a : g.neighbors(u)) {
      auto vi = static_cast<std::size_t>(a.other);
      if (on_path[vi]) continue;
      on_path[vi] = true;
      stack.push_back(a.other);
      dfs(a.other, c + w[static_cast<std::size_t>(a.edge)]);
      stack.pop_back();
      on_path[vi] = false;
    }
  };
  dfs(s, 0.0);
  std::sort(out.begin(), out.end());
  return out;
}
} // namespace

TEST(KShortestPaths, KEqualsOneMatchesShortestPath) {
  auto g = make_grid_graph(3, 3);
  auto w = build_weights(g, WeightMode::Distance, nullptr);
  const auto s = g.find_node("r0c0").value();
  const auto t = g.find_node("r2c2").value();
  KspOptions opts;
  opts.k = 1;
  auto paths = k_shortest_paths(g, s, t, w, opts);
  ASSERT_EQ(paths.size(), 1u);
  auto sp = shortest_path(g, s, t, w);
  ASSERT_TRUE(sp.has_value());
  EXPECT_EQ(paths[0].nodes, sp->nodes);
  EXPECT_DOUBLE_EQ(paths[0].cost, sp->cost);
}

TEST(KShortestPaths, DiamondHasExactlyTwoSimplePaths) {
  auto g = make_diamond_graph();
  auto w = build_weights(g, WeightMode::Distance, nullptr);
  KspOptions opts;
  opts.k = 5;
  auto paths = k_shortest_paths(g, g.find_node("A").value(), g.find_node("D").value(), w, opts);
  ASSERT_EQ(paths.size(), 2u);
  EXPECT_EQ(ids_of(g, paths[0]), (std::vector<std::string>{"A", "B", "D"}));
  EXPECT_EQ(ids_of(g, paths[1]), (std::vector<std::string>{"A", "C", "D"}));
  EXPECT_DOUBLE_EQ(paths[0].cost, 20.0);
  EXPECT_DOUBLE_EQ(paths[1].cost, 20.0);
}

TEST(KShortestPaths, PathsAreSimpleDistinctAndSorted) {
  auto g = make_grid_graph(3, 3);
  auto w = build_weights(g, WeightMode::Distance, nullptr);
  const auto s = g.find_node("r0c0").value();
  const auto t = g.find_node("r2c2").value();
  KspOptions opts;
  opts.k = 10;
  auto paths = k_shortest_paths(g, s, t, w, opts);
  ASSERT_EQ(paths.size(), 10u);

  std::set<std::vector<NodeIndex>> distinct;
  for (std::size_t i = 0; i < paths.size(); ++i) {
    SCOPED_TRACE(i);
    expect_simple_path(g, paths[i], s, t);
    EXPECT_TRUE(distinct.insert(paths[i].nodes).second);
    if (i > 0) EXPECT_GE(paths[i].cost + 1e-9, paths[i - 1].cost);
  }
  // Six monotone lattice routes of length 4 come first
  for (std::size_t i = 0; i < 6; ++i) EXPECT_DOUBLE_EQ(paths[i].cost, 4.0);
  EXPECT_DOUBLE_EQ(paths[6].cost, 6.0);
}

TEST(KShortestPaths, FewerPathsThanRequestedIsNotAnError) {
  auto g = make_line_graph(4);
  auto w = build_weights(g, WeightMode::Distance, nullptr);
  KspOptions opts;
  opts.k = 3;
  auto paths = k_shortest_paths(g, 0, 3, w, opts);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_DOUBLE_EQ(paths[0].cost, 3.0);
}

TEST(KShortestPaths, UnreachableAndTrivialPairs) {
  auto g = make_disconnected_graph();
  auto w = build_weights(g, WeightMode::Distance, nullptr);
  KspOptions opts;
  opts.k = 3;
  EXPECT_TRUE(k_shortest_paths(g, g.find_node("A").value(), g.find_node("C").value(), w, opts).empty());

  auto self = k_shortest_paths(g, 0, 0, w, opts);
  ASSERT_EQ(self.size(), 1u);
  EXPECT_EQ(self[0].nodes.size(), 1u);
  EXPECT_DOUBLE_EQ(self[0].cost, 0.0);
}

TEST(KShortestPaths, MaxCostFactorDropsExpensiveAlternates) {
  auto g = make_diamond_graph();
  auto w = build_weights(g, WeightMode::Distance, nullptr);
  w[static_cast<std::size_t>(g.find_edge("AB").value())] = 15.0;  // A-B-D costs 25, A-C-D 20
  const auto a = g.find_node("A").value();
  const auto d = g.find_node("D").value();

  KspOptions opts;
  opts.k = 3;
  opts.max_cost_factor = 1.2;
  auto tight = k_shortest_paths(g, a, d, w, opts);
  ASSERT_EQ(tight.size(), 1u);
  EXPECT_EQ(ids_of(g, tight[0]), (std::vector<std::string>{"A", "C", "D"}));

  opts.max_cost_factor = 1.25;
  EXPECT_EQ(k_shortest_paths(g, a, d, w, opts).size(), 2u);
}

TEST(KShortestPaths, RejectsInvalidOptions) {
  auto g = make_diamond_graph();
  auto w = build_weights(g, WeightMode::Distance, nullptr);
  KspOptions opts;
  opts.k = 0;
  EXPECT_THROW((void)k_shortest_paths(g, 0, 3, w, opts), ValueError);
  opts.k = 2;
  opts.max_cost_factor = 0.5;
  EXPECT_THROW((void)k_shortest_paths(g, 0, 3, w, opts), ValueError);
  opts.max_cost_factor = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW((void)k_shortest_paths(g, 0, 3, w, opts), ValueError);
}

TEST(KShortestPaths, RepeatedCallsAreIdentical) {
  auto g = make_grid_graph(4, 4);
  auto w = build_weights(g, WeightMode::Distance, nullptr);
  KspOptions opts;
  opts.k = 8;
  auto first = k_shortest_paths(g, 0, g.num_nodes() - 1, w, opts);
  auto second = k_shortest_paths(g, 0, g.num_nodes() - 1, w, opts);
  ASSERT_EQ(first.size(), second.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].nodes, second[i].nodes);
    EXPECT_EQ(first[i].edges, second[i].edges);
    EXPECT_EQ(first[i].cost, second[i].cost);
  }
}

TEST(KShortestPaths, MatchesExhaustiveOrderingWithTiedWeights) {
  auto g = make_grid_graph(3, 4);
  const auto s = g.find_node("r0c0").value();
  const auto t = g.find_node("r2c3").value();
  for (int seed = 0; seed < 12; ++seed) {
    SCOPED_TRACE(seed);
    std::vector<Cost> w(static_cast<std::size_t>(g.num_edges()));
    for (std::size_t e = 0; e < w.size(); ++e) w[e] = 1.0 + static_cast<double>((e * 7 + static_cast<std::size_t>(seed) * 5) % 3);

    auto expected = all_simple_paths(g, s, t, w);
    KspOptions opts;
    opts.k = static_cast<int>(expected.size());
    auto paths = k_shortest_paths(g, s, t, w, opts);
    ASSERT_EQ(paths.size(), expected.size());
    for (std::size_t i = 0; i < paths.size(); ++i) {
      EXPECT_EQ(paths[i].cost, expected[i].first) << "rank " << i;
      EXPECT_EQ(paths[i].nodes, expected[i].second) << "rank " << i;
    }
  }
}
