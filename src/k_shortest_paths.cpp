#include "pathcast/core/k_shortest_paths.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <queue>
#include <unordered_set>
#include <utility>
#include <vector>

#include "pathcast/core/error.hpp"

namespace pathcast::core {

namespace {
struct Candidate {
  Cost cost;
  std::vector<NodeIndex> nodes;
  std::vector<EdgeIndex> edges;
  // Min-heap order: cheaper first, then smaller node sequence. Costs are
  // compared exactly; a tolerance here would break the heap's strict weak
  // ordering.
  bool operator>(const Candidate& o) const {
    if (cost != o.cost) return cost > o.cost;
    return nodes > o.nodes;
  }
};

struct VectorHash {
  std::size_t operator()(const std::vector<NodeIndex>& v) const noexcept {
    std::size_t h = 1469598103934665603ull;
    for (auto x : v) { h ^= static_cast<std::size_t>(x) + 0x9e3779b97f4a7c15ull; h *= 1099511628211ull; }
    return h;
  }
};

std::unique_ptr<bool[]> make_mask(std::size_t n) {
  auto mask = std::make_unique<bool[]>(n);
  std::fill_n(mask.get(), n, true);
  return mask;
}
} // namespace

std::vector<Path> k_shortest_paths(const GraphStore& g, NodeIndex s, NodeIndex t,
                                   std::span<const Cost> weights,
                                   const KspOptions& opts) {
  if (opts.k < 1) throw ValueError("k must be >= 1, got " + std::to_string(opts.k));
  if (opts.max_cost_factor && !(std::isfinite(*opts.max_cost_factor) && *opts.max_cost_factor >= 1.0)) {
    throw ValueError("max_cost_factor must be finite and >= 1");
  }

  std::vector<Path> paths;
  auto p0 = shortest_path(g, s, t, weights);
  if (!p0) return paths;
  paths.push_back(std::move(*p0));
  if (opts.k == 1 || s == t) return paths;

  Cost max_cost = std::numeric_limits<Cost>::infinity();
  if (opts.max_cost_factor) max_cost = paths.front().cost * (*opts.max_cost_factor);

  // Candidate heap across spur deviations
  std::priority_queue<Candidate, std::vector<Candidate>, std::greater<Candidate>> B;
  std::unordered_set<std::vector<NodeIndex>, VectorHash> seen;
  seen.insert(paths.front().nodes);

  const auto N = static_cast<std::size_t>(g.num_nodes());
  const auto M = static_cast<std::size_t>(g.num_edges());
  while (static_cast<int>(paths.size()) < opts.k) {
    // Copy: paths may reallocate when the next path is accepted
    const Path last = paths.back();
    std::vector<Cost> prefix_cost(last.nodes.size(), 0.0);
    for (std::size_t idx = 1; idx < last.nodes.size(); ++idx) {
      prefix_cost[idx] = prefix_cost[idx - 1] + weights[static_cast<std::size_t>(last.edges[idx - 1])];
    }
    // Spur node positions 0..len-2
    for (std::size_t j = 0; j + 1 < last.nodes.size(); ++j) {
      const NodeIndex spur_node = last.nodes[j];
      // Root prefix nodes [0..j-1] may not be revisited
      auto node_mask = make_mask(N);
      for (std::size_t r = 0; r < j; ++r) node_mask[static_cast<std::size_t>(last.nodes[r])] = false;
      // Block the next edge of every accepted path sharing this root
      auto edge_mask = make_mask(M);
      for (const auto& P : paths) {
        if (P.nodes.size() > j + 1 &&
            std::equal(P.nodes.begin(), P.nodes.begin() + static_cast<std::ptrdiff_t>(j + 1), last.nodes.begin())) {
          edge_mask[static_cast<std::size_t>(P.edges[j])] = false;
        }
      }
      auto spur = shortest_path(g, spur_node, t, weights, node_mask.get(), edge_mask.get());
      if (!spur) continue;

      Candidate c;
      c.cost = prefix_cost[j] + spur->cost;
      if (c.cost > max_cost && !costs_tie(c.cost, max_cost)) continue;
      c.nodes.reserve(j + spur->nodes.size());
      c.nodes.assign(last.nodes.begin(), last.nodes.begin() + static_cast<std::ptrdiff_t>(j));
      c.nodes.insert(c.nodes.end(), spur->nodes.begin(), spur->nodes.end());
      if (!seen.insert(c.nodes).second) continue;
      c.edges.reserve(j + spur->edges.size());
      c.edges.assign(last.edges.begin(), last.edges.begin() + static_cast<std::ptrdiff_t>(j));
      c.edges.insert(c.edges.end(), spur->edges.begin(), spur->edges.end());
      B.push(std::move(c));
    }
    if (B.empty()) break;
    Candidate next = B.top(); B.pop();
    paths.push_back(Path{std::move(next.nodes), std::move(next.edges), next.cost});
  }
  return paths;
}

} // namespace pathcast::core
