#pragma once

#include <string>

namespace dg_mcp {

/**
 * @brief Immutable settings for the Deepgram collaborator
 *
 * Built once in main() and handed to DeepgramClient. The API key is read
 * from the environment exactly once; it is never re-read afterwards.
 */
struct ServerConfig {
    static constexpr const char* API_KEY_ENV = "DEEPGRAM_API_KEY";
    static constexpr const char* DEFAULT_API_URL = "https://api.deepgram.com";
    static constexpr const char* DEFAULT_MODEL = "aura-asteria-en";
    static constexpr int DEFAULT_TIMEOUT_SECONDS = 300;

    std::string api_key;
    std::string api_url = DEFAULT_API_URL;
    std::string model = DEFAULT_MODEL;
    int timeout_seconds = DEFAULT_TIMEOUT_SECONDS;

    /**
     * @brief Build configuration, taking the API key from DEEPGRAM_API_KEY
     *
     * @param api_url Base URL of the text-to-speech API
     * @param model Voice model passed as the "model" query parameter
     * @param timeout_seconds Connect/read/write timeout for the HTTP client
     * @throws std::runtime_error if the variable is unset or empty
     * @throws std::invalid_argument if timeout_seconds is not positive, the
     *         model is empty or the API URL is rejected by normalize_api_url()
     */
    static ServerConfig from_environment(const std::string& api_url = DEFAULT_API_URL,
                                         const std::string& model = DEFAULT_MODEL,
                                         int timeout_seconds = DEFAULT_TIMEOUT_SECONDS);

    /**
     * @brief Check an API base URL and strip a trailing "/"
     *
     * Accepts "http://host[:port]" and "https://host[:port]" only. The speak
     * endpoint path is appended by the client, so a URL carrying its own
     * path, query or fragment is rejected.
     *
     * @param api_url URL as given on the command line
     * @return URL without trailing slash
     * @throws std::invalid_argument if the URL is not a scheme and authority
     */
    static std::string normalize_api_url(const std::string& api_url);
};

} // namespace dg_mcp
