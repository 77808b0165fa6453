/*
  Pybind11 module exposing PathCast-Core to the Python service layer.

  Notes:
    - Graph, forecast cache and routing engine are shared_ptr-held so the
      Python objects keep each other alive.
    - Route and forecast results are returned as plain dicts/lists shaped
      for JSON responses.
    - The GIL is released around forecast computation and path search;
      Python-backed predictors reacquire it only while calling into Python.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pathcast/core/error.hpp"
#include "pathcast/core/flow_predictor.hpp"
#include "pathcast/core/forecast_cache.hpp"
#include "pathcast/core/graph_io.hpp"
#include "pathcast/core/graph_store.hpp"
#include "pathcast/core/logging.hpp"
#include "pathcast/core/routing_engine.hpp"
#include "pathcast/core/time_context.hpp"
#include "pathcast/core/types.hpp"

namespace py = pybind11;
using namespace pathcast::core;

namespace {

// Base for predictors that call back into Python. Holds the Python object
// and makes sure it is released with the GIL held.
class PyPredictorBase : public FlowPredictor {
public:
  explicit PyPredictorBase(py::object target) : target_(std::move(target)) {}
  ~PyPredictorBase() noexcept override {
    py::gil_scoped_acquire acq;
    target_ = py::object();
  }

protected:
  py::object target_;
};

// Wraps any object with a scikit-learn style predict(X) method. X is the
// (num_edges, 7) float64 feature matrix from build_feature_rows().
class PyModelPredictor final : public PyPredictorBase {
public:
  PyModelPredictor(py::object model, FeatureOptions opts)
      : PyPredictorBase(std::move(model)), opts_(opts) {}

  std::vector<Flow> predict_all(const TimeContext& ctx, const GraphStore& g) const override {
    auto rows = build_feature_rows(g, ctx, opts_);
    py::gil_scoped_acquire acq;
    try {
      py::array_t<double> X({static_cast<py::ssize_t>(rows.size()), static_cast<py::ssize_t>(kNumFeatures)});
      auto x = X.mutable_unchecked<2>();
      for (std::size_t i = 0; i < rows.size(); ++i) {
        for (std::size_t j = 0; j < kNumFeatures; ++j) {
          x(static_cast<py::ssize_t>(i), static_cast<py::ssize_t>(j)) = rows[i][j];
        }
      }
      py::object y = target_.attr("predict")(X);
      auto arr = py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(y);
      if (!arr) throw PredictionError("model.predict() did not return a numeric array");
      auto buf = arr.request();
      const auto* p = static_cast<const double*>(buf.ptr);
      return std::vector<Flow>(p, p + buf.size);
    } catch (py::error_already_set& e) {
      throw PredictionError(std::string("model.predict() raised: ") + e.what());
    }
  }

private:
  FeatureOptions opts_;
};

// Wraps a Python callable f(hour, day_of_week, is_peak, edge_id) -> flow.
class PyCallablePredictor final : public PyPredictorBase {
public:
  using PyPredictorBase::PyPredictorBase;

  std::vector<Flow> predict_all(const TimeContext& ctx, const GraphStore& g) const override {
    py::gil_scoped_acquire acq;
    std::vector<Flow> out;
    out.reserve(static_cast<std::size_t>(g.num_edges()));
    try {
      for (const auto& e : g.edges()) {
        out.push_back(py::cast<double>(target_(ctx.hour, ctx.day_of_week, ctx.is_peak, e.id)));
      }
    } catch (py::error_already_set& e) {
      throw PredictionError(std::string("flow callable raised: ") + e.what());
    } catch (const py::cast_error& e) {
      throw PredictionError(std::string("flow callable returned a non-number: ") + e.what());
    }
    return out;
  }
};

template <typename T>
T get_field(const py::dict& rec, const char* key) {
  if (!rec.contains(key)) throw MalformedGraph(std::string("record is missing field '") + key + "'");
  return py::cast<T>(rec[key]);
}

template <typename T>
T get_field_or(const py::dict& rec, const char* key, T fallback) {
  if (!rec.contains(key) || rec[key].is_none()) return fallback;
  return py::cast<T>(rec[key]);
}

py::dict summary_to_dict(const GraphSummary& s) {
  py::dict d;
  d["num_nodes"] = s.num_nodes;
  d["num_edges"] = s.num_edges;
  d["connected"] = s.connected;
  return d;
}

py::dict context_to_dict(const TimeContext& ctx) {
  py::dict d;
  d["hour"] = ctx.hour;
  d["day_of_week"] = ctx.day_of_week;
  d["is_peak"] = ctx.is_peak;
  return d;
}

py::list forecast_to_records(const GraphStore& g, const ForecastEntry& f) {
  py::list out;
  for (const auto& ef : f.edges) {
    const Edge& e = g.edge(ef.edge);
    py::dict d;
    d["edge_id"] = e.id;
    d["source"] = e.source;
    d["target"] = e.target;
    d["pred_flow"] = ef.pred_flow;
    d["capacity"] = ef.capacity;
    d["ratio"] = ef.ratio;
    d["level"] = std::string(to_string(congestion_level(ef.ratio)));
    out.append(std::move(d));
  }
  return out;
}

py::dict route_to_dict(const Route& r) {
  py::dict d;
  d["path"] = r.path;
  py::list coords;
  for (const auto& p : r.coords) {
    py::dict c;
    c["id"] = p.id;
    c["lat"] = p.lat;
    c["lon"] = p.lon;
    c["label"] = p.label;
    coords.append(std::move(c));
  }
  d["coords"] = std::move(coords);
  d["len_m"] = r.len_m;
  d["cost"] = r.cost;
  d["walk_min"] = r.walk_min;
  return d;
}

// Flat keys per mode: "best"/"best_alts" and "shortest"/"shortest_alts".
// A mode that was not requested contributes no keys.
void put_route_set(py::dict& d, const char* key, const std::optional<RouteSet>& rs) {
  if (!rs) return;
  d[key] = route_to_dict(rs->primary);
  py::list alts;
  for (const auto& r : rs->alternates) alts.append(route_to_dict(r));
  d[py::str(std::string(key) + "_alts")] = std::move(alts);
}

py::dict response_to_dict(const RouteResponse& r) {
  py::dict d;
  d["reachable"] = r.reachable;
  if (!r.reachable) d["message"] = r.message;
  put_route_set(d, "best", r.best);
  put_route_set(d, "shortest", r.shortest);
  d["forecast_context"] = r.forecast_context ? py::object(context_to_dict(*r.forecast_context)) : py::none();
  return d;
}

py::dict node_to_dict(const Node& n) {
  py::dict d;
  d["id"] = n.id; d["lat"] = n.lat; d["lon"] = n.lon; d["label"] = n.label; d["kind"] = n.kind;
  return d;
}

py::dict edge_to_dict(const Edge& e) {
  py::dict d;
  d["id"] = e.id;
  d["source"] = e.source;
  d["target"] = e.target;
  d["length_m"] = e.length_m;
  d["capacity"] = e.capacity;
  d["kind"] = e.kind;
  return d;
}

py::list nodes_to_list(const GraphStore& g) {
  py::list out;
  for (const auto& n : g.nodes()) out.append(node_to_dict(n));
  return out;
}

py::list edges_to_list(const GraphStore& g) {
  py::list out;
  for (const auto& e : g.edges()) out.append(edge_to_dict(e));
  return out;
}

PenaltyModel parse_penalty_model(const std::string& s) {
  if (s == "linear") return PenaltyModel::Linear;
  if (s == "stepped") return PenaltyModel::Stepped;
  throw ValueError("penalty_model must be 'linear' or 'stepped', got '" + s + "'");
}

} // namespace

PYBIND11_MODULE(_pathcast_core, m) {
  m.doc() = "PathCast-Core C++ bindings";

  auto base_err = py::register_exception<Error>(m, "PathCastError", PyExc_RuntimeError);
  py::register_exception<ValueError>(m, "InvalidArgument", PyExc_ValueError);
  py::register_exception<MalformedGraph>(m, "MalformedGraph", base_err.ptr());
  py::register_exception<UnknownNode>(m, "UnknownNode", base_err.ptr());
  py::register_exception<ForecastNotReady>(m, "ForecastNotReady", base_err.ptr());
  py::register_exception<PredictionError>(m, "PredictionError", base_err.ptr());

  m.def("set_log_level", [](const std::string& level){
    set_log_level(spdlog::level::from_str(level));
  }, py::arg("level"));

  py::class_<TimeContext>(m, "TimeContext")
      .def(py::init([](int hour, int day_of_week, std::optional<bool> is_peak){
        if (!is_peak) return TimeContext::from_hour(hour, day_of_week);
        TimeContext ctx {hour, day_of_week, *is_peak};
        ctx.validate();
        return ctx;
      }),
        py::arg("hour"), py::arg("day_of_week"), py::arg("is_peak") = py::none())
      .def_readonly("hour", &TimeContext::hour)
      .def_readonly("day_of_week", &TimeContext::day_of_week)
      .def_readonly("is_peak", &TimeContext::is_peak)
      .def("index", &TimeContext::index)
      .def("__eq__", [](const TimeContext& a, const TimeContext& b){ return a == b; })
      .def("__hash__", &TimeContext::index)
      .def("__repr__", [](const TimeContext& c){ return "TimeContext" + c.to_string(); });

  py::class_<GraphStore, std::shared_ptr<GraphStore>>(m, "GraphStore")
      .def_static("from_csv", [](const std::filesystem::path& nodes, const std::filesystem::path& edges){
        return std::make_shared<GraphStore>(load_graph_csv(nodes, edges));
      }, py::arg("nodes_csv"), py::arg("edges_csv"))
      .def_static("from_records", [](const py::list& node_recs, const py::list& edge_recs){
        std::vector<Node> nodes;
        nodes.reserve(node_recs.size());
        for (auto item : node_recs) {
          auto rec = py::cast<py::dict>(item);
          nodes.push_back(Node{get_field<std::string>(rec, "id"), get_field<double>(rec, "lat"),
                               get_field<double>(rec, "lon"), get_field_or<std::string>(rec, "label", ""),
                               get_field_or<std::string>(rec, "kind", "junction")});
        }
        std::vector<Edge> edges;
        edges.reserve(edge_recs.size());
        for (auto item : edge_recs) {
          auto rec = py::cast<py::dict>(item);
          edges.push_back(Edge{get_field<std::string>(rec, "id"), get_field<std::string>(rec, "source"),
                               get_field<std::string>(rec, "target"), get_field<double>(rec, "length_m"),
                               get_field<double>(rec, "capacity"), get_field_or<std::string>(rec, "kind", "path")});
        }
        return std::make_shared<GraphStore>(GraphStore::load(nodes, edges));
      }, py::arg("nodes"), py::arg("edges"))
      .def("num_nodes", &GraphStore::num_nodes)
      .def("num_edges", &GraphStore::num_edges)
      .def("summary", [](const GraphStore& g){ return summary_to_dict(g.summary()); })
      .def("has_node", [](const GraphStore& g, const std::string& id){ return g.find_node(id).has_value(); })
      .def("node", [](const GraphStore& g, const std::string& id){
        auto v = g.find_node(id);
        if (!v) throw UnknownNode(id);
        return node_to_dict(g.node(*v));
      }, py::arg("id"))
      .def("nodes", &nodes_to_list)
      .def("edges", &edges_to_list)
      .def("to_records", [](const GraphStore& g){
        py::dict d;
        d["nodes"] = nodes_to_list(g);
        d["edges"] = edges_to_list(g);
        return d;
      })
      .def("length_view", [](py::object self_obj, const GraphStore& g){
        auto s = g.length_view();
        return py::array(
            py::buffer_info(
                const_cast<double*>(s.data()),
                sizeof(double),
                py::format_descriptor<double>::format(),
                1,
                { s.size() },
                { sizeof(double) }
            ),
            self_obj
        );
      })
      .def("capacity_view", [](py::object self_obj, const GraphStore& g){
        auto s = g.capacity_view();
        return py::array(
            py::buffer_info(
                const_cast<double*>(s.data()),
                sizeof(double),
                py::format_descriptor<double>::format(),
                1,
                { s.size() },
                { sizeof(double) }
            ),
            self_obj
        );
      });

  py::class_<FlowPredictor, std::shared_ptr<FlowPredictor>>(m, "FlowPredictor");

  m.def("baseline_predictor", [](){
    return std::const_pointer_cast<FlowPredictor>(make_baseline_predictor());
  });
  m.def("model_predictor", [](py::object model, double lag_fraction){
    if (!py::hasattr(model, "predict")) throw py::type_error("model must have a predict(X) method");
    FeatureOptions opts;
    opts.lag_fraction = lag_fraction;
    return std::shared_ptr<FlowPredictor>(std::make_shared<PyModelPredictor>(std::move(model), opts));
  }, py::arg("model"), py::kw_only(), py::arg("lag_fraction") = kDefaultLagFraction);
  m.def("callable_predictor", [](py::function fn){
    return std::shared_ptr<FlowPredictor>(std::make_shared<PyCallablePredictor>(std::move(fn)));
  }, py::arg("fn"));

  m.def("build_feature_rows", [](const GraphStore& g, const TimeContext& ctx, double lag_fraction){
    FeatureOptions opts;
    opts.lag_fraction = lag_fraction;
    auto rows = build_feature_rows(g, ctx, opts);
    py::array_t<double> X({static_cast<py::ssize_t>(rows.size()), static_cast<py::ssize_t>(kNumFeatures)});
    auto x = X.mutable_unchecked<2>();
    for (std::size_t i = 0; i < rows.size(); ++i) {
      for (std::size_t j = 0; j < kNumFeatures; ++j) x(static_cast<py::ssize_t>(i), static_cast<py::ssize_t>(j)) = rows[i][j];
    }
    return X;
  }, py::arg("graph"), py::arg("context"), py::kw_only(), py::arg("lag_fraction") = kDefaultLagFraction);
  m.attr("FEATURE_NAMES") = [](){
    py::list names;
    for (auto n : kFeatureNames) names.append(std::string(n));
    return names;
  }();

  py::class_<ForecastCache, std::shared_ptr<ForecastCache>>(m, "ForecastCache")
      .def(py::init([](std::shared_ptr<GraphStore> graph, std::shared_ptr<FlowPredictor> predictor){
        return std::make_shared<ForecastCache>(std::move(graph), std::move(predictor));
      }), py::arg("graph"), py::arg("predictor"))
      .def("get_or_compute", [](ForecastCache& c, const TimeContext& ctx){
        py::gil_scoped_release rel; auto f = c.get_or_compute(ctx); py::gil_scoped_acquire acq;
        return forecast_to_records(c.graph(), *f);
      }, py::arg("context"))
      .def("peek", [](const ForecastCache& c, const TimeContext& ctx) -> py::object {
        auto f = c.peek(ctx);
        if (!f) return py::none();
        return forecast_to_records(c.graph(), *f);
      }, py::arg("context"))
      .def("active_context", [](const ForecastCache& c) -> py::object {
        auto f = c.active();
        if (!f) return py::none();
        return py::cast(f->context);
      })
      .def("size", &ForecastCache::size)
      .def("computations", &ForecastCache::computations);

  py::class_<RoutingEngine, std::shared_ptr<RoutingEngine>>(m, "RoutingEngine")
      .def(py::init([](std::shared_ptr<GraphStore> graph, std::shared_ptr<ForecastCache> cache,
                       double congestion_weight, const std::string& penalty_model,
                       double walking_speed_mps, std::optional<double> max_cost_factor){
        RouterOptions opts;
        opts.weights.congestion_weight = congestion_weight;
        opts.weights.penalty_model = parse_penalty_model(penalty_model);
        opts.walking_speed_mps = walking_speed_mps;
        opts.max_cost_factor = max_cost_factor;
        return std::make_shared<RoutingEngine>(std::move(graph), std::move(cache), opts);
      }),
        py::arg("graph"), py::arg("cache"), py::kw_only(),
        py::arg("congestion_weight") = kDefaultCongestionWeight,
        py::arg("penalty_model") = "linear",
        py::arg("walking_speed_mps") = kDefaultWalkingSpeedMps,
        py::arg("max_cost_factor") = py::none())
      .def("find_routes", [](const RoutingEngine& eng, const std::string& source, const std::string& target,
                             const std::string& mode, int k, std::optional<TimeContext> context){
        RouteQuery q;
        q.source = source;
        q.target = target;
        q.mode = parse_route_mode(mode);
        q.k = k;
        py::gil_scoped_release rel;
        auto res = context ? eng.find_routes(q, *context) : eng.find_routes(q);
        py::gil_scoped_acquire acq;
        return response_to_dict(res);
      },
        py::arg("source"), py::arg("target"), py::kw_only(),
        py::arg("mode") = "both", py::arg("k") = 3, py::arg("context") = py::none());
}
