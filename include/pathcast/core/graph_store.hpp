/* Immutable undirected walking graph with string ids and CSR adjacency. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pathcast/core/types.hpp"

namespace pathcast::core {

struct Node {
  std::string id;
  double lat {0.0};
  double lon {0.0};
  std::string label;
  std::string kind;
};

struct Edge {
  std::string id;
  std::string source;
  std::string target;
  double length_m {0.0};
  Cap capacity {0.0};
  std::string kind;
};

// One CSR adjacency entry: the edge taken and the node on its other end.
struct Adjacent {
  EdgeIndex edge {-1};
  NodeIndex other {-1};
};

struct GraphSummary {
  std::int32_t num_nodes {0};
  std::int32_t num_edges {0};
  bool connected {false};
};

// Notes on indices:
// - NodeIndex values are assigned in ascending lexicographic order of node
//   ids, so comparing index sequences orders paths by their id sequences.
// - EdgeIndex values follow input order. Each edge appears twice in the
//   adjacency (once per endpoint); edge_source/edge_target keep the
//   canonical direction as loaded.
class GraphStore {
public:
  // Validates and compacts the input. Throws MalformedGraph on any
  // structural or numeric violation; no partial graph is ever produced.
  [[nodiscard]] static GraphStore load(std::span<const Node> nodes,
                                       std::span<const Edge> edges);

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(nodes_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(edges_.size()); }

  [[nodiscard]] const Node& node(NodeIndex v) const { return nodes_.at(static_cast<std::size_t>(v)); }
  [[nodiscard]] const Edge& edge(EdgeIndex e) const { return edges_.at(static_cast<std::size_t>(e)); }
  [[nodiscard]] std::span<const Node> nodes() const noexcept { return nodes_; }
  [[nodiscard]] std::span<const Edge> edges() const noexcept { return edges_; }

  [[nodiscard]] std::optional<NodeIndex> find_node(std::string_view id) const;
  [[nodiscard]] std::optional<EdgeIndex> find_edge(std::string_view id) const;

  // Undirected lookup: the edge joining u and v in either direction.
  [[nodiscard]] std::optional<EdgeIndex> edge_between(NodeIndex u, NodeIndex v) const noexcept;
  [[nodiscard]] std::optional<EdgeIndex> edge_between(std::string_view u, std::string_view v) const;

  // Neighbors of v sorted by neighbor index.
  [[nodiscard]] std::span<const Adjacent> neighbors(NodeIndex v) const noexcept;

  [[nodiscard]] std::span<const NodeIndex> edge_source_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const NodeIndex> edge_target_view() const noexcept { return dst_; }
  [[nodiscard]] std::span<const double> length_view() const noexcept { return length_; }
  [[nodiscard]] std::span<const Cap> capacity_view() const noexcept { return capacity_; }
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }

  [[nodiscard]] GraphSummary summary() const;

private:
  std::vector<Node> nodes_ {};
  std::vector<Edge> edges_ {};
  std::unordered_map<std::string, NodeIndex> node_index_ {};
  std::unordered_map<std::string, EdgeIndex> edge_index_ {};

  // Per-edge numeric columns in EdgeIndex order
  std::vector<NodeIndex> src_ {};
  std::vector<NodeIndex> dst_ {};
  std::vector<double> length_ {};
  std::vector<Cap> capacity_ {};

  // CSR adjacency over both directions of every edge
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<Adjacent> adjacency_ {};
};

} // namespace pathcast::core
