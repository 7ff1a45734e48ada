#pragma once

#include "core/ToolArguments.hpp"
#include "core/ToolError.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace dg_mcp {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments

    /**
     * @brief Descriptor as returned by tools/list
     */
    json to_json() const;
};

/**
 * @brief Function signature for tool execution
 * @param args Arguments extracted from the tools/call request
 * @return MCP tool result or error
 */
using ToolHandler = std::function<Result<json>(const ToolArguments& args)>;

/**
 * @brief Catalogue of invocable tools
 *
 * Populated once at startup, read-only while serving. Tools are listed in
 * registration order.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     * @throws std::invalid_argument on empty name, null handler or duplicate name
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Descriptors of all registered tools
     */
    const std::vector<ToolInfo>& list_tools() const { return tools_; }

    /**
     * @brief Invoke a tool by name
     * @param name Tool name
     * @param args Tool arguments
     * @return Handler result, or UNKNOWN_TOOL
     */
    Result<json> invoke(const std::string& name, const ToolArguments& args) const;

private:
    std::vector<ToolInfo> tools_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace dg_mcp
