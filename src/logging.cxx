#include "fitsmeta/logging.hxx"

// Local headers
#include "get_env.hxx"

// Third-party headers
#include <spdlog/sinks/stdout_color_sinks.h>

// Standard library
#include <string>

namespace fitsmeta {
namespace {
const std::string logger_name = "fitsmeta";
}  // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::shared_ptr<spdlog::logger> result = spdlog::get(logger_name);
    if (!result) {
        result = spdlog::stderr_color_mt(logger_name);
        result->set_level(spdlog::level::warn);
    }
    return result;
}

void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }

spdlog::level::level_enum log_level_from_env(spdlog::level::level_enum default_level) {
    std::string value = get_env(log_level_variable);
    if (value.empty()) return default_level;

    // spdlog maps unknown names to `off`.
    spdlog::level::level_enum level = spdlog::level::from_str(value);
    if (level == spdlog::level::off && value != "off") {
        logger()->warn("ignoring invalid {}: {}", log_level_variable, value);
        return default_level;
    }
    return level;
}
}  // namespace fitsmeta
