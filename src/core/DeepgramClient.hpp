#pragma once

#include "ISpeechSynthesizer.hpp"
#include "ServerConfig.hpp"
#include <memory>

// Forward declaration to avoid including heavy httplib header
namespace httplib {
    class Client;
}

namespace dg_mcp {

/**
 * @brief Deepgram text-to-speech client
 *
 * Sends POST {api_url}/v1/speak?model={model} with a {"text": ...} body and
 * "Authorization: Token <key>". A 2xx response body is the audio payload.
 * Non-2xx responses are reported with the response body as diagnostic.
 *
 * One request at a time; the call blocks until the API answers or the
 * configured timeout expires.
 */
class DeepgramClient : public ISpeechSynthesizer {
public:
    /**
     * @brief Construct client from configuration
     * @param config Server configuration (API key, URL, model, timeout)
     * @throws std::invalid_argument if the API URL is not usable
     *
     * The model is percent-encoded into the query string.
     */
    explicit DeepgramClient(const ServerConfig& config);
    ~DeepgramClient() override;

    DeepgramClient(const DeepgramClient&) = delete;
    DeepgramClient& operator=(const DeepgramClient&) = delete;

    Result<std::string> synthesize(const std::string& text) override;

private:
    ServerConfig config_;
    std::string speak_path_;
    std::unique_ptr<httplib::Client> client_;
};

} // namespace dg_mcp
