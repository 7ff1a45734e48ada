#pragma once

#include "JsonRpc.hpp"
#include <string>
#include <string_view>
#include <variant>

namespace dg_mcp {

/**
 * @brief Reason a line could not be turned into a Request
 */
struct DecodeFailure {
    std::string message;
};

using DecodeResult = std::variant<Request, DecodeFailure>;

/**
 * @brief Converts between single text lines and JSON-RPC messages
 */
class MessageCodec {
public:
    /**
     * @brief Parse one line into a Request
     *
     * Fails on invalid JSON, non-object values, a jsonrpc field other than
     * "2.0", a missing or non-string method, and ids that are not string,
     * number or null.
     *
     * @param line Single line without its terminator
     * @return Request or DecodeFailure with a diagnostic message
     */
    static DecodeResult decode(std::string_view line);

    /**
     * @brief Serialize a Response to one line of UTF-8 text
     *
     * Never fails and never contains a newline. Invalid UTF-8 in strings is
     * replaced with U+FFFD.
     */
    static std::string encode(const Response& response);
};

} // namespace dg_mcp
