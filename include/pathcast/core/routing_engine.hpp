/*
  RoutingEngine: congestion-aware multi-path route queries.

  Holds shared references to the immutable graph and the process-wide
  forecast cache. Queries are independent; nothing but the cache carries
  state between calls.
*/
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pathcast/core/constants.hpp"
#include "pathcast/core/forecast_cache.hpp"
#include "pathcast/core/graph_store.hpp"
#include "pathcast/core/shortest_paths.hpp"
#include "pathcast/core/time_context.hpp"
#include "pathcast/core/types.hpp"
#include "pathcast/core/weight_function.hpp"

namespace pathcast::core {

struct RouterOptions {
  WeightOptions weights {};
  double walking_speed_mps {kDefaultWalkingSpeedMps};
  // Forwarded to KspOptions::max_cost_factor for alternates.
  std::optional<double> max_cost_factor {};

  void validate() const;
};

struct RouteQuery {
  std::string source;
  std::string target;
  RouteMode mode {RouteMode::Both};
  int k {3};
};

struct RoutePoint {
  std::string id;
  double lat {0.0};
  double lon {0.0};
  std::string label;
};

struct Route {
  std::vector<std::string> path;
  std::vector<RoutePoint> coords;
  double len_m {0.0};     // physical length, whatever the weight function
  Cost cost {0.0};        // total under the weight function that ranked it
  double walk_min {0.0};
};

struct RouteSet {
  Route primary;
  std::vector<Route> alternates;  // at most k-1, ascending cost
};

struct RouteResponse {
  std::optional<RouteSet> shortest;  // distance mode
  std::optional<RouteSet> best;      // penalized mode
  std::optional<TimeContext> forecast_context;  // forecast used, if any
  bool reachable {true};
  std::string message;  // set when !reachable
};

class RoutingEngine {
public:
  RoutingEngine(std::shared_ptr<const GraphStore> graph,
                std::shared_ptr<ForecastCache> cache,
                RouterOptions opts = {});

  // Routes with the cache's active forecast. Throws UnknownNode, ValueError
  // (k < 1), or ForecastNotReady when a penalized mode is requested before
  // any forecast was computed. A disconnected pair is not an error: the
  // response has reachable == false.
  [[nodiscard]] RouteResponse find_routes(const RouteQuery& q) const;

  // Resolves (computing if needed) the forecast for ctx first, then routes.
  [[nodiscard]] RouteResponse find_routes(const RouteQuery& q, const TimeContext& ctx) const;

  [[nodiscard]] const RouterOptions& options() const noexcept { return opts_; }
  [[nodiscard]] const GraphStore& graph() const noexcept { return *graph_; }

private:
  [[nodiscard]] RouteResponse route_with(const RouteQuery& q, const ForecastEntry* forecast) const;
  [[nodiscard]] std::optional<RouteSet> route_set(NodeIndex s, NodeIndex t, WeightMode mode,
                                                  int k, const ForecastEntry* forecast) const;
  [[nodiscard]] Route to_route(const Path& p) const;

  std::shared_ptr<const GraphStore> graph_;
  std::shared_ptr<ForecastCache> cache_;
  RouterOptions opts_;
};

} // namespace pathcast::core
