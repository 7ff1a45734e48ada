#include "ToolArguments.hpp"
#include <spdlog/spdlog.h>

namespace dg_mcp {

ToolArguments ToolArguments::from_json(const json& object) {
    ToolArguments args;
    if (!object.is_object()) {
        return args;
    }

    for (const auto& [key, value] : object.items()) {
        args.values_[key] = value;
    }
    return args;
}

Result<std::string> ToolArguments::require_string(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end() || it->second.is_null()) {
        return ToolError{ErrorKind::MISSING_PARAMETER, "Missing '" + name + "' parameter"};
    }
    if (!it->second.is_string()) {
        return ToolError{ErrorKind::TYPE_MISMATCH,
            "Parameter '" + name + "' must be a string, got " + it->second.type_name()};
    }
    return it->second.get<std::string>();
}

std::string ToolArguments::optional_string(const std::string& name,
                                           const std::string& fallback) const {
    auto it = values_.find(name);
    if (it == values_.end() || it->second.is_null()) {
        return fallback;
    }
    if (!it->second.is_string()) {
        spdlog::warn("Ignoring non-string '{}' parameter ({}), using '{}'",
                     name, it->second.type_name(), fallback);
        return fallback;
    }
    return it->second.get<std::string>();
}

} // namespace dg_mcp
