#pragma once

#include "JsonRpc.hpp"
#include "ToolRegistry.hpp"
#include <memory>

namespace dg_mcp {

/**
 * @brief Routes JSON-RPC requests to method handlers
 *
 * Supports methods: initialize, tools/list, tools/call. Every handler
 * returns a Result; dispatch() converts failures into error responses with
 * code -32603, so no failure leaves dispatch(). The request id is echoed
 * verbatim, including its absence.
 */
class RequestDispatcher {
public:
    static constexpr const char* PROTOCOL_VERSION = "2024-11-05";
    static constexpr const char* SERVER_NAME = "deepgram-mcp";
    static constexpr const char* SERVER_VERSION = "0.1.0";

    /**
     * @brief Construct dispatcher over a tool registry
     * @param registry Registry of available tools
     * @throws std::invalid_argument if registry is null
     */
    explicit RequestDispatcher(std::shared_ptr<const ToolRegistry> registry);

    /**
     * @brief Handle one request
     * @param request Decoded JSON-RPC request
     * @return Response carrying either result or error
     */
    Response dispatch(const Request& request) const;

private:
    Result<json> route(const Request& request) const;

    /**
     * @brief Handle initialize method (MCP handshake)
     * @return Server capabilities and info
     */
    Result<json> handle_initialize() const;

    /**
     * @brief Handle tools/list method
     * @return JSON array of available tools with schemas
     */
    Result<json> handle_tools_list() const;

    /**
     * @brief Handle tools/call method
     * @param params Request parameters with tool name and arguments
     * @return Tool execution result
     */
    Result<json> handle_tools_call(const std::optional<json>& params) const;

    std::shared_ptr<const ToolRegistry> registry_;
};

} // namespace dg_mcp
