#include "ToolError.hpp"

namespace dg_mcp {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNKNOWN_METHOD:        return "unknown_method";
        case ErrorKind::MISSING_PARAMS:        return "missing_params";
        case ErrorKind::MISSING_TOOL_NAME:     return "missing_tool_name";
        case ErrorKind::INVALID_ARGUMENTS:     return "invalid_arguments";
        case ErrorKind::UNKNOWN_TOOL:          return "unknown_tool";
        case ErrorKind::MISSING_PARAMETER:     return "missing_parameter";
        case ErrorKind::TYPE_MISMATCH:         return "type_mismatch";
        case ErrorKind::TOOL_EXECUTION_FAILED: return "tool_execution_failed";
    }
    return "unknown";
}

} // namespace dg_mcp
