#pragma once

#include <string>

namespace dg_mcp {

/// Name of the server's default logger
constexpr const char* LOGGER_NAME = "deepgram-mcp";

/**
 * @brief Route the default spdlog logger to stderr and set its level
 *
 * stdout carries protocol traffic only, so every log line has to go to
 * stderr. Calling this again reuses the already registered logger.
 *
 * @param level One of trace, debug, info, warn, error, critical
 * @return false if the level name is not recognized (logger left unchanged)
 */
bool configure_logging(const std::string& level);

} // namespace dg_mcp
