#pragma once

// Third-party headers
#include <spdlog/spdlog.h>

// Standard library
#include <memory>

namespace fitsmeta {

// Name of the environment variable holding the default log level.
constexpr const char* log_level_variable = "FITSMETA_LOG_LEVEL";

// The library logger. Writes to standard error so standard output only carries reports.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

// Parses FITSMETA_LOG_LEVEL, falling back to `default_level` if it is unset or invalid.
spdlog::level::level_enum log_level_from_env(spdlog::level::level_enum default_level);
}  // namespace fitsmeta
