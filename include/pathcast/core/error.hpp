#pragma once

#include <stdexcept>
#include <string>

namespace pathcast::core {

enum class ErrorKind {
  InvalidArgument,
  MalformedGraph,
  UnknownNode,
  NoPath,
  ForecastNotReady,
  PredictionFailed
};

// Base class for all engine errors; kind() discriminates without RTTI.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}
  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

struct ValueError : public Error {
  explicit ValueError(const std::string& what) : Error(ErrorKind::InvalidArgument, what) {}
};

struct MalformedGraph : public Error {
  explicit MalformedGraph(const std::string& what) : Error(ErrorKind::MalformedGraph, what) {}
};

struct UnknownNode : public Error {
  explicit UnknownNode(const std::string& node_id)
      : Error(ErrorKind::UnknownNode, "unknown node id: " + node_id), node_id_(node_id) {}
  [[nodiscard]] const std::string& node_id() const noexcept { return node_id_; }

private:
  std::string node_id_;
};

struct ForecastNotReady : public Error {
  ForecastNotReady()
      : Error(ErrorKind::ForecastNotReady,
              "no forecast loaded; request a forecast before penalized routing") {}
};

struct PredictionError : public Error {
  explicit PredictionError(const std::string& what) : Error(ErrorKind::PredictionFailed, what) {}
};

} // namespace pathcast::core
