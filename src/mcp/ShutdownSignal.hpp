#pragma once

namespace dg_mcp {

class MCPServer;

/**
 * @brief SIGINT/SIGTERM handling for the stdio server
 *
 * Handlers are installed with sigaction and without SA_RESTART, so a read
 * blocked on stdin returns as soon as a signal arrives. The handler itself
 * only stores to lock-free atomics: it records the request and asks the
 * attached server to stop.
 */
class ShutdownSignal {
public:
    /**
     * @brief Install handlers for SIGINT and SIGTERM
     * @param server Server to stop when a signal arrives (may be null)
     * @throws std::runtime_error if sigaction fails
     */
    static void install(MCPServer* server);

    /**
     * @brief Restore the previous handlers and clear the pending request
     */
    static void uninstall();

    /**
     * @brief Check whether a shutdown signal has been received
     */
    static bool requested();
};

} // namespace dg_mcp
