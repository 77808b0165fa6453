/*
  shortest_path: Dijkstra over the undirected GraphStore.

  Features:
    - Arbitrary per-edge weight vector (distance or penalized costs).
    - Optional node/edge masks used by the k-shortest-paths spur searches.
    - Deterministic ties: when a second predecessor reaches a node at the
      same cost, the predecessor whose own path has the smaller node
      sequence is kept. With strictly positive weights every candidate
      predecessor is settled before the node itself, so the choice is final.
    - Early exit once the destination is settled.
*/
#include "pathcast/core/shortest_paths.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <string>
#include <utility>

#include "pathcast/core/constants.hpp"
#include "pathcast/core/error.hpp"

namespace pathcast::core {

namespace {
void validate_weights(const GraphStore& g, std::span<const Cost> weights) {
  if (weights.size() != static_cast<std::size_t>(g.num_edges())) {
    throw ValueError("weights length " + std::to_string(weights.size()) +
                     " does not match edge count " + std::to_string(g.num_edges()));
  }
  for (auto w : weights) {
    if (!std::isfinite(w) || w < 0.0) throw ValueError("weights must be finite and >= 0");
  }
}

std::vector<NodeIndex> chain_to(NodeIndex v, const std::vector<NodeIndex>& parent) {
  std::vector<NodeIndex> seq;
  for (; v >= 0; v = parent[static_cast<std::size_t>(v)]) seq.push_back(v);
  std::reverse(seq.begin(), seq.end());
  return seq;
}

// Compares the full sequences ending in v, not just the predecessor chains:
// one chain may be a prefix of the other.
bool better_chain(NodeIndex cand, NodeIndex current, NodeIndex v, const std::vector<NodeIndex>& parent) {
  auto a = chain_to(cand, parent);
  auto b = chain_to(current, parent);
  a.push_back(v);
  b.push_back(v);
  return a < b;
}
} // namespace

bool costs_tie(Cost a, Cost b) noexcept {
  const double scale = std::max({1.0, std::abs(a), std::abs(b)});
  return std::abs(a - b) <= kCostEpsilon * scale;
}

std::optional<Path>
shortest_path(const GraphStore& g, NodeIndex s, NodeIndex t,
              std::span<const Cost> weights,
              const bool* node_mask,
              const bool* edge_mask) {
  validate_weights(g, weights);
  const int N = g.num_nodes();
  if (s < 0 || t < 0 || s >= N || t >= N) return std::nullopt;
  auto ok_node = [&](NodeIndex v){ return !node_mask || node_mask[static_cast<std::size_t>(v)]; };
  auto ok_edge = [&](EdgeIndex e){ return !edge_mask || edge_mask[static_cast<std::size_t>(e)]; };
  if (!ok_node(s) || !ok_node(t)) return std::nullopt;
  if (s == t) return Path{{s}, {}, 0.0};

  std::vector<Cost> dist(static_cast<std::size_t>(N), std::numeric_limits<Cost>::infinity());
  std::vector<NodeIndex> parent(static_cast<std::size_t>(N), -1);
  std::vector<EdgeIndex> via(static_cast<std::size_t>(N), -1);
  std::vector<unsigned char> settled(static_cast<std::size_t>(N), 0);
  using QItem = std::pair<Cost, NodeIndex>;
  auto cmp = [](const QItem& a, const QItem& b){ return a.first > b.first; };
  std::priority_queue<QItem, std::vector<QItem>, decltype(cmp)> pq(cmp);
  dist[static_cast<std::size_t>(s)] = 0.0;
  pq.emplace(0.0, s);

  while (!pq.empty()) {
    auto [d_u, u] = pq.top(); pq.pop();
    auto ui = static_cast<std::size_t>(u);
    if (settled[ui]) continue;
    settled[ui] = 1;
    if (u == t) break;
    for (const auto& adj : g.neighbors(u)) {
      const NodeIndex v = adj.other;
      const auto vi = static_cast<std::size_t>(v);
      if (settled[vi] || !ok_node(v) || !ok_edge(adj.edge)) continue;
      const Cost nd = d_u + weights[static_cast<std::size_t>(adj.edge)];
      if (std::isfinite(dist[vi]) && costs_tie(nd, dist[vi])) {
        // Equal-cost alternative predecessor: keep the lexicographically smaller chain
        if (parent[vi] != u && better_chain(u, parent[vi], v, parent)) {
          parent[vi] = u;
          via[vi] = adj.edge;
        }
      } else if (nd < dist[vi]) {
        dist[vi] = nd; parent[vi] = u; via[vi] = adj.edge;
        pq.emplace(nd, v);
      }
    }
  }
  if (!settled[static_cast<std::size_t>(t)]) return std::nullopt;

  // Reconstruct
  Path p;
  p.nodes = chain_to(t, parent);
  p.edges.reserve(p.nodes.size() - 1);
  for (std::size_t i = 1; i < p.nodes.size(); ++i) {
    p.edges.push_back(via[static_cast<std::size_t>(p.nodes[i])]);
  }
  for (auto e : p.edges) p.cost += weights[static_cast<std::size_t>(e)];
  return p;
}

double path_length_m(const GraphStore& g, const Path& p) noexcept {
  auto length = g.length_view();
  double total = 0.0;
  for (auto e : p.edges) total += length[static_cast<std::size_t>(e)];
  return total;
}

} // namespace pathcast::core
