#include "ToolRegistry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace dg_mcp {

json ToolInfo::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

void ToolRegistry::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }
    if (handlers_.count(info.name) > 0) {
        throw std::invalid_argument("Tool already registered: " + info.name);
    }

    tools_.push_back(info);
    handlers_[info.name] = std::move(handler);
    spdlog::info("Registered tool: {}", info.name);
}

Result<json> ToolRegistry::invoke(const std::string& name, const ToolArguments& args) const {
    auto handler_it = handlers_.find(name);
    if (handler_it == handlers_.end()) {
        return ToolError{ErrorKind::UNKNOWN_TOOL, "Unknown tool: " + name};
    }

    spdlog::debug("Calling tool: {}", name);
    return handler_it->second(args);
}

} // namespace dg_mcp
