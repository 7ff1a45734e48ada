#include "Logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dg_mcp {

bool configure_logging(const std::string& level) {
    spdlog::level::level_enum parsed;
    if (level == "trace") {
        parsed = spdlog::level::trace;
    } else if (level == "debug") {
        parsed = spdlog::level::debug;
    } else if (level == "info") {
        parsed = spdlog::level::info;
    } else if (level == "warn") {
        parsed = spdlog::level::warn;
    } else if (level == "error") {
        parsed = spdlog::level::err;
    } else if (level == "critical") {
        parsed = spdlog::level::critical;
    } else {
        return false;
    }

    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(parsed);
    return true;
}

} // namespace dg_mcp
