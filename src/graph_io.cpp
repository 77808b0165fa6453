/*
  CSV ingestion for nodes.csv / edges.csv.

  Columns are located by header name so column order does not matter.
  Every row is parsed strictly; the first bad row aborts the whole load with
  MalformedGraph naming the file and line.
*/
#include "pathcast/core/graph_io.hpp"

#include <charconv>
#include <fstream>
#include <optional>
#include <unordered_map>

#include "pathcast/core/error.hpp"
#include "pathcast/core/logging.hpp"

namespace pathcast::core {

namespace {

struct CsvTable {
  std::string file;
  std::unordered_map<std::string, std::size_t> columns;
  std::vector<std::pair<std::size_t, std::vector<std::string>>> rows;  // (line number, fields)
};

std::string trim(std::string_view s) {
  auto b = s.find_first_not_of(" \t\r");
  if (b == std::string_view::npos) return {};
  auto e = s.find_last_not_of(" \t\r");
  return std::string(s.substr(b, e - b + 1));
}

std::vector<std::string> split_record(const CsvTable& t, std::size_t lineno, std::string_view line) {
  try {
    return split_csv_line(line);
  } catch (const MalformedGraph& e) {
    throw MalformedGraph(t.file + ":" + std::to_string(lineno) + ": " + e.what());
  }
}

CsvTable read_table(const std::filesystem::path& path) {
  CsvTable t;
  t.file = path.string();
  std::ifstream in(path);
  if (!in.is_open()) throw MalformedGraph("cannot open " + t.file);

  std::string line;
  if (!std::getline(in, line)) throw MalformedGraph(t.file + ": missing header row");
  if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);  // UTF-8 BOM
  auto header = split_record(t, 1, line);
  for (std::size_t i = 0; i < header.size(); ++i) t.columns.emplace(trim(header[i]), i);

  std::size_t lineno = 1;
  while (std::getline(in, line)) {
    ++lineno;
    if (trim(line).empty()) continue;
    t.rows.emplace_back(lineno, split_record(t, lineno, line));
  }
  if (in.bad()) throw MalformedGraph(t.file + ": read error");
  return t;
}

std::size_t require_column(const CsvTable& t, const char* name) {
  auto it = t.columns.find(name);
  if (it == t.columns.end()) throw MalformedGraph(t.file + ": missing column '" + name + "'");
  return it->second;
}

std::optional<std::size_t> optional_column(const CsvTable& t, const char* name) {
  auto it = t.columns.find(name);
  if (it == t.columns.end()) return std::nullopt;
  return it->second;
}

const std::string& field(const CsvTable& t, std::size_t lineno,
                         const std::vector<std::string>& row, std::size_t col) {
  if (col >= row.size()) {
    throw MalformedGraph(t.file + ":" + std::to_string(lineno) + ": expected at least " +
                         std::to_string(col + 1) + " fields, got " + std::to_string(row.size()));
  }
  return row[col];
}

double parse_double(const CsvTable& t, std::size_t lineno, const std::string& raw, const char* name) {
  auto s = trim(raw);
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (s.empty() || ec != std::errc() || ptr != s.data() + s.size()) {
    throw MalformedGraph(t.file + ":" + std::to_string(lineno) + ": invalid " + name + " '" + s + "'");
  }
  return value;
}

} // namespace

std::vector<std::string> split_csv_line(std::string_view line) {
  std::vector<std::string> out;
  std::string cur;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') { cur.push_back('"'); ++i; }
        else quoted = false;
      } else {
        cur.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      out.push_back(std::move(cur));
      cur.clear();
    } else if (c != '\r' && c != '\n') {
      cur.push_back(c);
    }
  }
  if (quoted) throw MalformedGraph("unterminated quoted field");
  out.push_back(std::move(cur));
  return out;
}

std::vector<Node> read_nodes_csv(const std::filesystem::path& path) {
  auto t = read_table(path);
  const auto c_id = require_column(t, "id");
  const auto c_lat = require_column(t, "lat");
  const auto c_lon = require_column(t, "lon");
  const auto c_label = optional_column(t, "label");
  const auto c_kind = optional_column(t, "kind");

  std::vector<Node> nodes;
  nodes.reserve(t.rows.size());
  for (const auto& [lineno, row] : t.rows) {
    Node n;
    n.id = trim(field(t, lineno, row, c_id));
    n.lat = parse_double(t, lineno, field(t, lineno, row, c_lat), "lat");
    n.lon = parse_double(t, lineno, field(t, lineno, row, c_lon), "lon");
    if (c_label && *c_label < row.size()) n.label = trim(row[*c_label]);
    if (c_kind && *c_kind < row.size()) n.kind = trim(row[*c_kind]);
    nodes.push_back(std::move(n));
  }
  return nodes;
}

std::vector<Edge> read_edges_csv(const std::filesystem::path& path) {
  auto t = read_table(path);
  const auto c_id = require_column(t, "id");
  const auto c_src = require_column(t, "source");
  const auto c_dst = require_column(t, "target");
  const auto c_len = require_column(t, "length_m");
  const auto c_cap = require_column(t, "capacity");
  const auto c_kind = optional_column(t, "kind");

  std::vector<Edge> edges;
  edges.reserve(t.rows.size());
  for (const auto& [lineno, row] : t.rows) {
    Edge e;
    e.id = trim(field(t, lineno, row, c_id));
    e.source = trim(field(t, lineno, row, c_src));
    e.target = trim(field(t, lineno, row, c_dst));
    e.length_m = parse_double(t, lineno, field(t, lineno, row, c_len), "length_m");
    e.capacity = parse_double(t, lineno, field(t, lineno, row, c_cap), "capacity");
    e.kind = (c_kind && *c_kind < row.size()) ? trim(row[*c_kind]) : std::string("path");
    edges.push_back(std::move(e));
  }
  return edges;
}

GraphStore load_graph_csv(const std::filesystem::path& nodes_path,
                          const std::filesystem::path& edges_path) {
  auto nodes = read_nodes_csv(nodes_path);
  auto edges = read_edges_csv(edges_path);
  auto g = GraphStore::load(nodes, edges);
  auto s = g.summary();
  logger()->info("loaded graph from {} / {}: {} nodes, {} edges, connected={}",
                 nodes_path.string(), edges_path.string(), s.num_nodes, s.num_edges, s.connected);
  return g;
}

} // namespace pathcast::core
