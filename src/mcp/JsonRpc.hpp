#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace dg_mcp {

using json = nlohmann::json;

constexpr const char* JSONRPC_VERSION = "2.0";

/**
 * @brief Incoming JSON-RPC request
 *
 * An absent id and an explicit null id are distinct: the former is
 * std::nullopt, the latter holds a null json value.
 */
struct Request {
    std::optional<json> id;
    std::string method;
    std::optional<json> params;
};

/**
 * @brief JSON-RPC error object
 */
struct Error {
    int code;
    std::string message;
    std::optional<json> data;
};

/**
 * @brief Outgoing JSON-RPC response
 *
 * Holds either a result or an error, never both. Construct with
 * success() or failure().
 */
class Response {
public:
    static Response success(std::optional<json> id, json result);
    static Response failure(std::optional<json> id, Error error);

    const std::optional<json>& id() const { return id_; }
    bool is_error() const { return error_.has_value(); }

    /**
     * @brief Result value (only meaningful when !is_error())
     */
    const json& result() const { return result_; }

    /**
     * @brief Error object (only meaningful when is_error())
     */
    const Error& error() const { return *error_; }

    /**
     * @brief Build the wire representation
     *
     * "id" is omitted when the request had none; exactly one of
     * "result"/"error" is present.
     */
    json to_json() const;

private:
    Response() = default;

    std::optional<json> id_;
    json result_;
    std::optional<Error> error_;
};

} // namespace dg_mcp
