#include "MCPServer.hpp"
#include "MessageCodec.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace dg_mcp {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

} // anonymous namespace

MCPServer::MCPServer(std::unique_ptr<ITransport> transport,
                     std::shared_ptr<const RequestDispatcher> dispatcher)
    : transport_(std::move(transport)), dispatcher_(std::move(dispatcher)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    if (!dispatcher_) {
        throw std::invalid_argument("Dispatcher cannot be null");
    }
    spdlog::info("MCPServer initialized");
}

bool MCPServer::run() {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    bool clean = true;
    while (running_) {
        if (!transport_->is_open()) {
            spdlog::error("Transport closed, stopping server");
            clean = false;
            break;
        }

        ReadResult read = transport_->read_line();

        if (read.status == ReadStatus::END_OF_STREAM) {
            spdlog::info("Input closed, stopping server");
            break;
        }
        if (read.status == ReadStatus::ERROR) {
            spdlog::error("Failed to read line, stopping server");
            clean = false;
            break;
        }
        if (is_blank(read.line)) {
            continue;
        }

        if (!handle_line(read.line)) {
            clean = false;
            break;
        }
    }

    if (!running_) {
        spdlog::info("MCPServer stop requested");
    }
    running_ = false;
    spdlog::info("MCPServer stopped");
    return clean;
}

void MCPServer::stop() {
    // Called from signal handlers: only touch the lock-free flag
    running_ = false;
}

bool MCPServer::handle_line(const std::string& line) {
    DecodeResult decoded = MessageCodec::decode(line);
    if (auto* failure = std::get_if<DecodeFailure>(&decoded)) {
        spdlog::warn("Failed to parse request: {}", failure->message);
        return true;
    }

    Response response = dispatcher_->dispatch(std::get<Request>(decoded));
    if (!transport_->write_line(MessageCodec::encode(response))) {
        spdlog::error("Failed to write response, stopping server");
        return false;
    }
    return true;
}

} // namespace dg_mcp
