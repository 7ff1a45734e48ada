#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace dg_mcp {

/**
 * @brief JSON-RPC error codes used by the server
 */
namespace error_code {
    constexpr int INTERNAL_ERROR = -32603;
} // namespace error_code

/**
 * @brief Failure categories produced while handling a request
 */
enum class ErrorKind {
    UNKNOWN_METHOD,        // Method is not in the routing table
    MISSING_PARAMS,        // tools/call without params
    MISSING_TOOL_NAME,     // tools/call params without a string name
    INVALID_ARGUMENTS,     // tools/call arguments is not an object
    UNKNOWN_TOOL,          // No tool registered under the name
    MISSING_PARAMETER,     // Required tool parameter absent
    TYPE_MISMATCH,         // Tool parameter has the wrong JSON type
    TOOL_EXECUTION_FAILED  // Collaborator or artifact write failed
};

/**
 * @brief A handler failure: kind plus human-readable message
 *
 * The message is what ends up in the JSON-RPC error object.
 */
struct ToolError {
    ErrorKind kind;
    std::string message;
};

/**
 * @brief Value-or-error returned by every handler and extraction function
 */
template <typename T>
using Result = std::variant<T, ToolError>;

std::string_view to_string(ErrorKind kind);

} // namespace dg_mcp
