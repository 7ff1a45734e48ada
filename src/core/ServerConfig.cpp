#include "ServerConfig.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace dg_mcp {

ServerConfig ServerConfig::from_environment(const std::string& api_url,
                                            const std::string& model,
                                            int timeout_seconds) {
    const char* key = std::getenv(API_KEY_ENV);
    if (key == nullptr || *key == '\0') {
        throw std::runtime_error(std::string(API_KEY_ENV) + " environment variable not set");
    }
    if (timeout_seconds <= 0) {
        throw std::invalid_argument("Timeout must be a positive number of seconds");
    }
    if (model.empty()) {
        throw std::invalid_argument("Model cannot be empty");
    }

    ServerConfig config;
    config.api_key = key;
    config.api_url = normalize_api_url(api_url);
    config.model = model;
    config.timeout_seconds = timeout_seconds;

    spdlog::debug("Configuration loaded: api_url={}, model={}, timeout={}s",
                  config.api_url, config.model, config.timeout_seconds);
    return config;
}

std::string ServerConfig::normalize_api_url(const std::string& api_url) {
    if (api_url.empty()) {
        throw std::invalid_argument("API URL cannot be empty");
    }

    auto scheme_end = api_url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("API URL must start with http:// or https://: " + api_url);
    }
    std::string scheme = api_url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("Unsupported API URL scheme '" + scheme + "': " + api_url);
    }

    std::string authority = api_url.substr(scheme_end + 3);
    if (!authority.empty() && authority.back() == '/') {
        authority.pop_back();
    }
    if (authority.empty()) {
        throw std::invalid_argument("API URL has no host: " + api_url);
    }
    if (authority.find_first_of("/?#") != std::string::npos) {
        throw std::invalid_argument("API URL must not contain a path, query or fragment: " + api_url);
    }
    return scheme + "://" + authority;
}

} // namespace dg_mcp
