#pragma once

#include "ToolError.hpp"
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace dg_mcp {

using json = nlohmann::json;

/**
 * @brief Arguments of a single tool invocation
 *
 * Built from the "arguments" object of a tools/call request. Keys the tool
 * does not ask for are ignored. Required parameters of the wrong JSON type
 * are reported as a ToolError; optional ones fall back to their default.
 */
class ToolArguments {
public:
    ToolArguments() = default;

    /**
     * @brief Build arguments from a JSON object
     * @param object JSON object (non-object values yield empty arguments)
     */
    static ToolArguments from_json(const json& object);

    /**
     * @brief Extract a required string parameter
     * @param name Parameter name
     * @return String value, MISSING_PARAMETER or TYPE_MISMATCH
     */
    Result<std::string> require_string(const std::string& name) const;

    /**
     * @brief Extract an optional string parameter
     * @param name Parameter name
     * @param fallback Value used when the parameter is absent, null or not a string
     * @return String value or fallback
     */
    std::string optional_string(const std::string& name, const std::string& fallback) const;

private:
    std::unordered_map<std::string, json> values_;
};

} // namespace dg_mcp
