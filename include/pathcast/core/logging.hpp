/* Library logger. All components log through the shared "pathcast" logger. */
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace pathcast::core {

// Returns the "pathcast" logger, creating it on first use. The initial level
// comes from SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=pathcast=debug), else info.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace pathcast::core
