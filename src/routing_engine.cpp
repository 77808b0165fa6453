/*
  RoutingEngine: resolves the forecast, builds weights per requested mode,
  runs k-shortest-paths once per weight function and assembles responses.
*/
#include "pathcast/core/routing_engine.hpp"

#include <cmath>

#include "pathcast/core/error.hpp"
#include "pathcast/core/k_shortest_paths.hpp"
#include "pathcast/core/logging.hpp"
#include "pathcast/core/shortest_paths.hpp"

namespace pathcast::core {

void RouterOptions::validate() const {
  weights.validate();
  if (!std::isfinite(walking_speed_mps) || walking_speed_mps <= 0.0) {
    throw ValueError("walking_speed_mps must be finite and > 0");
  }
  if (max_cost_factor && !(std::isfinite(*max_cost_factor) && *max_cost_factor >= 1.0)) {
    throw ValueError("max_cost_factor must be finite and >= 1");
  }
}

RoutingEngine::RoutingEngine(std::shared_ptr<const GraphStore> graph,
                             std::shared_ptr<ForecastCache> cache,
                             RouterOptions opts)
    : graph_(std::move(graph)), cache_(std::move(cache)), opts_(std::move(opts)) {
  if (!graph_) throw ValueError("RoutingEngine: graph must not be null");
  if (!cache_) throw ValueError("RoutingEngine: forecast cache must not be null");
  if (&cache_->graph() != graph_.get()) {
    throw ValueError("RoutingEngine: forecast cache was built for a different graph");
  }
  opts_.validate();
}

RouteResponse RoutingEngine::find_routes(const RouteQuery& q) const {
  auto forecast = cache_->active();
  return route_with(q, forecast.get());
}

RouteResponse RoutingEngine::find_routes(const RouteQuery& q, const TimeContext& ctx) const {
  auto forecast = cache_->get_or_compute(ctx);
  return route_with(q, forecast.get());
}

RouteResponse RoutingEngine::route_with(const RouteQuery& q, const ForecastEntry* forecast) const {
  if (q.k < 1) throw ValueError("k must be >= 1, got " + std::to_string(q.k));
  const auto s = graph_->find_node(q.source);
  if (!s) throw UnknownNode(q.source);
  const auto t = graph_->find_node(q.target);
  if (!t) throw UnknownNode(q.target);
  const bool penalized = includes(q.mode, WeightMode::Penalized);
  if (penalized && !forecast) throw ForecastNotReady();

  logger()->debug("find_routes {} -> {} mode={} k={}", q.source, q.target, to_string(q.mode), q.k);
  RouteResponse out;
  if (penalized) out.forecast_context = forecast->context;
  if (includes(q.mode, WeightMode::Distance)) {
    out.shortest = route_set(*s, *t, WeightMode::Distance, q.k, forecast);
  }
  if (penalized) {
    out.best = route_set(*s, *t, WeightMode::Penalized, q.k, forecast);
  }
  if (!out.shortest && !out.best) {
    out.reachable = false;
    out.message = "no path between '" + q.source + "' and '" + q.target + "'";
    logger()->debug("find_routes: {}", out.message);
  }
  return out;
}

std::optional<RouteSet> RoutingEngine::route_set(NodeIndex s, NodeIndex t, WeightMode mode,
                                                 int k, const ForecastEntry* forecast) const {
  const auto weights = build_weights(*graph_, mode, forecast, opts_.weights);
  KspOptions ksp;
  ksp.k = k;
  ksp.max_cost_factor = opts_.max_cost_factor;
  auto paths = k_shortest_paths(*graph_, s, t, weights, ksp);
  if (paths.empty()) return std::nullopt;

  RouteSet rs;
  rs.primary = to_route(paths.front());
  rs.alternates.reserve(paths.size() - 1);
  for (std::size_t i = 1; i < paths.size(); ++i) rs.alternates.push_back(to_route(paths[i]));
  return rs;
}

Route RoutingEngine::to_route(const Path& p) const {
  Route r;
  r.path.reserve(p.nodes.size());
  r.coords.reserve(p.nodes.size());
  for (auto v : p.nodes) {
    const Node& n = graph_->node(v);
    r.path.push_back(n.id);
    r.coords.push_back(RoutePoint{n.id, n.lat, n.lon, n.label});
  }
  r.len_m = path_length_m(*graph_, p);
  r.cost = p.cost;
  r.walk_min = r.len_m / opts_.walking_speed_mps / 60.0;
  return r;
}

} // namespace pathcast::core
