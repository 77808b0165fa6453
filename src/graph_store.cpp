/*
  GraphStore: immutable undirected walking graph with deterministic layout.

  Loading validates every row before anything is built, assigns node indices
  in lexicographic id order, and compacts both directions of every edge into
  CSR adjacency sorted by neighbor index for reproducible traversal.
*/
#include "pathcast/core/graph_store.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <numeric>

#include "pathcast/core/error.hpp"
#include "pathcast/core/logging.hpp"

namespace pathcast::core {

namespace {
std::string edge_context(const Edge& e) {
  return "edge '" + e.id + "' (" + e.source + " - " + e.target + ")";
}
} // namespace

GraphStore GraphStore::load(std::span<const Node> nodes, std::span<const Edge> edges) {
  if (nodes.size() > static_cast<std::size_t>(INT32_MAX) || edges.size() > static_cast<std::size_t>(INT32_MAX)) {
    throw MalformedGraph("graph too large for 32-bit indices");
  }
  GraphStore g;

  // Nodes: validate, then order by id so index order == lexicographic id order
  for (const auto& n : nodes) {
    if (n.id.empty()) throw MalformedGraph("node with empty id");
    if (!std::isfinite(n.lat) || !std::isfinite(n.lon)) {
      throw MalformedGraph("node '" + n.id + "' has non-finite coordinates");
    }
  }
  std::vector<std::size_t> order(nodes.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return nodes[a].id < nodes[b].id;
  });
  g.nodes_.reserve(nodes.size());
  for (std::size_t i = 0; i < order.size(); ++i) {
    const Node& n = nodes[order[i]];
    if (i > 0 && n.id == g.nodes_.back().id) {
      throw MalformedGraph("duplicate node id '" + n.id + "'");
    }
    g.node_index_.emplace(n.id, static_cast<NodeIndex>(i));
    g.nodes_.push_back(n);
  }

  // Edges: endpoints must exist, numeric fields positive and finite,
  // ids unique, at most one edge per unordered node pair.
  const std::size_t m = edges.size();
  g.edges_.reserve(m);
  g.src_.reserve(m);
  g.dst_.reserve(m);
  g.length_.reserve(m);
  g.capacity_.reserve(m);
  std::unordered_map<std::uint64_t, EdgeIndex> pair_index;
  pair_index.reserve(m);
  for (std::size_t i = 0; i < m; ++i) {
    const Edge& e = edges[i];
    if (e.id.empty()) throw MalformedGraph("edge with empty id");
    auto s = g.node_index_.find(e.source);
    auto t = g.node_index_.find(e.target);
    if (s == g.node_index_.end() || t == g.node_index_.end()) {
      throw MalformedGraph(edge_context(e) + " references an unknown node");
    }
    if (s->second == t->second) throw MalformedGraph(edge_context(e) + " is a self loop");
    if (!std::isfinite(e.length_m) || e.length_m <= 0.0) {
      throw MalformedGraph(edge_context(e) + " must have finite length_m > 0");
    }
    if (!std::isfinite(e.capacity) || e.capacity <= 0.0) {
      throw MalformedGraph(edge_context(e) + " must have finite capacity > 0");
    }
    const auto eidx = static_cast<EdgeIndex>(i);
    if (!g.edge_index_.emplace(e.id, eidx).second) {
      throw MalformedGraph("duplicate edge id '" + e.id + "'");
    }
    auto lo = static_cast<std::uint64_t>(std::min(s->second, t->second));
    auto hi = static_cast<std::uint64_t>(std::max(s->second, t->second));
    if (!pair_index.emplace((lo << 32) | hi, eidx).second) {
      throw MalformedGraph(edge_context(e) + " duplicates an existing node pair");
    }
    g.edges_.push_back(e);
    g.src_.push_back(s->second);
    g.dst_.push_back(t->second);
    g.length_.push_back(e.length_m);
    g.capacity_.push_back(e.capacity);
  }

  // Build CSR adjacency over both directions
  const auto n = nodes.size();
  g.row_offsets_.assign(n + 1, 0);
  for (std::size_t e = 0; e < m; ++e) {
    g.row_offsets_[static_cast<std::size_t>(g.src_[e]) + 1]++;
    g.row_offsets_[static_cast<std::size_t>(g.dst_[e]) + 1]++;
  }
  for (std::size_t i = 1; i < g.row_offsets_.size(); ++i) {
    g.row_offsets_[i] += g.row_offsets_[i - 1];
  }
  g.adjacency_.resize(2 * m);
  std::vector<std::int32_t> cursor = g.row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto u = g.src_[e];
    auto v = g.dst_[e];
    g.adjacency_[static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++)] = Adjacent{static_cast<EdgeIndex>(e), v};
    g.adjacency_[static_cast<std::size_t>(cursor[static_cast<std::size_t>(v)]++)] = Adjacent{static_cast<EdgeIndex>(e), u};
  }
  for (std::size_t v = 0; v < n; ++v) {
    auto first = g.adjacency_.begin() + g.row_offsets_[v];
    auto last = g.adjacency_.begin() + g.row_offsets_[v + 1];
    std::sort(first, last, [](const Adjacent& a, const Adjacent& b) { return a.other < b.other; });
  }

  logger()->debug("graph store built: {} nodes, {} edges", g.num_nodes(), g.num_edges());
  return g;
}

std::optional<NodeIndex> GraphStore::find_node(std::string_view id) const {
  auto it = node_index_.find(std::string(id));
  if (it == node_index_.end()) return std::nullopt;
  return it->second;
}

std::optional<EdgeIndex> GraphStore::find_edge(std::string_view id) const {
  auto it = edge_index_.find(std::string(id));
  if (it == edge_index_.end()) return std::nullopt;
  return it->second;
}

std::optional<EdgeIndex> GraphStore::edge_between(NodeIndex u, NodeIndex v) const noexcept {
  if (u < 0 || v < 0 || u >= num_nodes() || v >= num_nodes()) return std::nullopt;
  auto adj = neighbors(u);
  auto it = std::lower_bound(adj.begin(), adj.end(), v,
                             [](const Adjacent& a, NodeIndex x) { return a.other < x; });
  if (it == adj.end() || it->other != v) return std::nullopt;
  return it->edge;
}

std::optional<EdgeIndex> GraphStore::edge_between(std::string_view u, std::string_view v) const {
  auto ui = find_node(u);
  auto vi = find_node(v);
  if (!ui || !vi) return std::nullopt;
  return edge_between(*ui, *vi);
}

std::span<const Adjacent> GraphStore::neighbors(NodeIndex v) const noexcept {
  if (v < 0 || v >= num_nodes()) return {};
  auto start = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(v)]);
  auto end = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(v) + 1]);
  return std::span<const Adjacent>(adjacency_.data() + start, end - start);
}

GraphSummary GraphStore::summary() const {
  GraphSummary s;
  s.num_nodes = num_nodes();
  s.num_edges = num_edges();
  if (s.num_nodes == 0) return s;
  // BFS from node 0 over the undirected adjacency
  std::vector<unsigned char> seen(nodes_.size(), 0);
  std::deque<NodeIndex> queue {0};
  seen[0] = 1;
  std::int32_t reached = 1;
  while (!queue.empty()) {
    auto u = queue.front(); queue.pop_front();
    for (const auto& a : neighbors(u)) {
      auto& flag = seen[static_cast<std::size_t>(a.other)];
      if (!flag) { flag = 1; ++reached; queue.push_back(a.other); }
    }
  }
  s.connected = (reached == s.num_nodes);
  return s;
}

} // namespace pathcast::core
