/* CSV readers for the ingested node and edge tables. */
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "pathcast/core/graph_store.hpp"

namespace pathcast::core {

// nodes.csv columns: id, lat, lon, [label], [kind]
[[nodiscard]] std::vector<Node> read_nodes_csv(const std::filesystem::path& path);

// edges.csv columns: id, source, target, length_m, capacity, [kind]
[[nodiscard]] std::vector<Edge> read_edges_csv(const std::filesystem::path& path);

// Reads both tables and builds the store. Any malformed row fails the load.
[[nodiscard]] GraphStore load_graph_csv(const std::filesystem::path& nodes_path,
                                        const std::filesystem::path& edges_path);

// Splits one CSV record. Supports double-quoted fields with "" escapes.
// Throws MalformedGraph if a quoted field is not closed on the line.
[[nodiscard]] std::vector<std::string> split_csv_line(std::string_view line);

} // namespace pathcast::core
