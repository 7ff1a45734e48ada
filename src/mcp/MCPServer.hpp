#pragma once

#include "ITransport.hpp"
#include "RequestDispatcher.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace dg_mcp {

/**
 * @brief MCP session loop over a line-oriented transport
 *
 * Reads one line at a time, decodes it, dispatches the request and writes
 * the response before reading the next line. Requests are processed
 * strictly in order; responses appear in the order requests arrived.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @param dispatcher Request dispatcher
     */
    MCPServer(std::unique_ptr<ITransport> transport, std::shared_ptr<const RequestDispatcher> dispatcher);

    /**
     * @brief Start server main loop
     *
     * Blocks until the input ends, a stream error occurs, the transport
     * reports itself closed or stop() is called.
     * Blank lines are skipped. Lines that are not valid JSON-RPC requests are
     * logged and produce no output.
     *
     * @return true on end-of-stream or stop(), false on a read/write failure
     *         or a closed transport
     */
    bool run();

    /**
     * @brief Signal server to stop gracefully
     *
     * Async-signal-safe. A read already blocked in the transport is not
     * interrupted by this call; see ShutdownSignal.
     */
    void stop();

private:
    /**
     * @brief Decode, dispatch and answer one non-blank line
     * @return false if the response could not be written
     */
    bool handle_line(const std::string& line);

    std::unique_ptr<ITransport> transport_;
    std::shared_ptr<const RequestDispatcher> dispatcher_;
    std::atomic<bool> running_{false};
};

} // namespace dg_mcp
