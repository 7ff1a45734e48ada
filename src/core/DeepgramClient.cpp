#include "DeepgramClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace dg_mcp {

DeepgramClient::DeepgramClient(const ServerConfig& config)
    : config_(config),
      speak_path_("/v1/speak?model=" + httplib::detail::encode_query_param(config.model)) {
    config_.api_url = ServerConfig::normalize_api_url(config_.api_url);

    client_ = std::make_unique<httplib::Client>(config_.api_url);
    if (!client_->is_valid()) {
        throw std::invalid_argument("Unsupported API URL: " + config_.api_url);
    }

    client_->set_connection_timeout(config_.timeout_seconds);
    client_->set_read_timeout(config_.timeout_seconds);
    client_->set_write_timeout(config_.timeout_seconds);

    spdlog::debug("DeepgramClient initialized for {}{}", config_.api_url, speak_path_);
}

DeepgramClient::~DeepgramClient() = default;

Result<std::string> DeepgramClient::synthesize(const std::string& text) {
    httplib::Headers headers = {
        {"Authorization", "Token " + config_.api_key}
    };

    nlohmann::json body = {{"text", text}};

    spdlog::debug("Requesting speech for {} characters of text", text.size());

    auto result = client_->Post(speak_path_, headers,
        body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
        "application/json");

    if (!result) {
        std::string reason = httplib::to_string(result.error());
        spdlog::error("Deepgram request failed: {}", reason);
        return ToolError{ErrorKind::TOOL_EXECUTION_FAILED, "Deepgram request failed: " + reason};
    }

    if (result->status < 200 || result->status >= 300) {
        spdlog::error("Deepgram API returned status {}", result->status);
        return ToolError{ErrorKind::TOOL_EXECUTION_FAILED, "Deepgram API error: " + result->body};
    }

    spdlog::debug("Received {} bytes of audio", result->body.size());
    return std::move(result->body);
}

} // namespace dg_mcp
