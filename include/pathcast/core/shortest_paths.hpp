/* Single-pair Dijkstra over per-edge weights with deterministic tie-breaking. */
#pragma once

#include <optional>
#include <span>
#include <vector>

#include "pathcast/core/graph_store.hpp"
#include "pathcast/core/types.hpp"

namespace pathcast::core {

// A concrete simple path: nodes[i] -> nodes[i+1] via edges[i].
struct Path {
  std::vector<NodeIndex> nodes;
  std::vector<EdgeIndex> edges;
  Cost cost {0.0};  // sum of weights along edges
};

// True when a and b are equal within kCostEpsilon (relative).
[[nodiscard]] bool costs_tie(Cost a, Cost b) noexcept;

// Shortest path from src to dst under `weights` (one non-negative finite
// value per edge). Among equal-cost paths the one with the lexicographically
// smallest node sequence wins; since node indices follow id order this is
// the smallest id sequence.
//
// Optional masks (nullptr = no mask):
// - node_mask[v] == false excludes node v (src/dst included).
// - edge_mask[e] == false excludes edge e in both directions.
//
// Returns nullopt when dst is unreachable. Throws ValueError if weights do
// not match the graph or contain negative/non-finite values.
[[nodiscard]] std::optional<Path>
shortest_path(const GraphStore& g, NodeIndex src, NodeIndex dst,
              std::span<const Cost> weights,
              const bool* node_mask = nullptr,
              const bool* edge_mask = nullptr);

// Physical length of a path (sum of length_m), independent of weights.
[[nodiscard]] double path_length_m(const GraphStore& g, const Path& p) noexcept;

} // namespace pathcast::core
