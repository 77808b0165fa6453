#include "pathcast/core/logging.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pathcast::core {

namespace {
constexpr const char* kLoggerName = "pathcast";

std::shared_ptr<spdlog::logger> make_logger() {
  // Another component may already have registered the name (e.g. a host
  // application configuring its own sinks); reuse it in that case.
  if (auto existing = spdlog::get(kLoggerName)) return existing;
  auto lg = spdlog::stdout_color_mt(kLoggerName);
  lg->set_level(spdlog::level::info);
  spdlog::cfg::load_env_levels();
  return lg;
}
} // namespace

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = make_logger();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

} // namespace pathcast::core
