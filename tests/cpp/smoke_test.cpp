#include <gtest/gtest.h>
#include <vector>
#include "pathcast/core/graph_store.hpp"

using namespace pathcast::core;

TEST(GraphSmoke, LoadFromRows) {
  std::vector<Node> nodes {{"a", 33.0, 72.0, "Gate", "poi"}, {"b", 33.1, 72.1, "", "junction"},
                           {"c", 33.2, 72.2, "Library", "poi"}};
  std::vector<Edge> edges {{"e1", "a", "b", 50.0, 400.0, "road"}, {"e2", "b", "c", 75.5, 200.0, "path"}};
  auto g = GraphStore::load(nodes, edges);
  EXPECT_EQ(g.num_nodes(), 3);
  EXPECT_EQ(g.num_edges(), 2);
}
