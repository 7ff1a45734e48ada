#include "ShutdownSignal.hpp"
#include "MCPServer.hpp"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <string>

namespace dg_mcp {

namespace {

std::atomic<bool> shutdown_requested{false};
std::atomic<MCPServer*> attached_server{nullptr};

struct sigaction previous_int_action;
struct sigaction previous_term_action;
bool installed = false;

void handle_signal(int /*signal*/) {
    shutdown_requested.store(true);
    if (MCPServer* server = attached_server.load()) {
        server->stop();
    }
}

} // anonymous namespace

void ShutdownSignal::install(MCPServer* server) {
    static_assert(std::atomic<bool>::is_always_lock_free, "signal flag must be lock-free");
    static_assert(std::atomic<MCPServer*>::is_always_lock_free, "server pointer must be lock-free");

    attached_server.store(server);
    shutdown_requested.store(false);
    if (installed) {
        return;
    }

    struct sigaction action {};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART: interrupt blocking reads

    if (sigaction(SIGINT, &action, &previous_int_action) != 0) {
        throw std::runtime_error(std::string("Failed to install SIGINT handler: ") + std::strerror(errno));
    }
    if (sigaction(SIGTERM, &action, &previous_term_action) != 0) {
        int saved_errno = errno;
        sigaction(SIGINT, &previous_int_action, nullptr);
        throw std::runtime_error(std::string("Failed to install SIGTERM handler: ") + std::strerror(saved_errno));
    }
    installed = true;
}

void ShutdownSignal::uninstall() {
    if (installed) {
        sigaction(SIGINT, &previous_int_action, nullptr);
        sigaction(SIGTERM, &previous_term_action, nullptr);
        installed = false;
    }
    attached_server.store(nullptr);
    shutdown_requested.store(false);
}

bool ShutdownSignal::requested() {
    return shutdown_requested.load();
}

} // namespace dg_mcp
