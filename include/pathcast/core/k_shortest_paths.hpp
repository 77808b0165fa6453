/* Yen's k loopless shortest paths over a per-edge weight vector. */
#pragma once

#include <optional>
#include <span>
#include <vector>

#include "pathcast/core/graph_store.hpp"
#include "pathcast/core/shortest_paths.hpp"
#include "pathcast/core/types.hpp"

namespace pathcast::core {

struct KspOptions {
  int k {1};  // total paths wanted (primary + k-1 alternates), >= 1
  // When set, drop paths costing more than factor * primary cost. Must be >= 1.
  std::optional<double> max_cost_factor {};
};

// Up to opts.k simple paths from src to dst ordered by (cost, node sequence).
// paths[0] is the shortest_path() result; every later path differs from all
// earlier ones by at least one edge. Fewer than k paths is not an error.
// Returns an empty vector if dst is unreachable. Throws ValueError on k < 1
// or an invalid max_cost_factor.
[[nodiscard]] std::vector<Path> k_shortest_paths(const GraphStore& g, NodeIndex src, NodeIndex dst,
                                                 std::span<const Cost> weights,
                                                 const KspOptions& opts);

} // namespace pathcast::core
