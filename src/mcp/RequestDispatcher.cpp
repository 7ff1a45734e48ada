#include "RequestDispatcher.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace dg_mcp {

namespace {

Result<std::string> extract_tool_name(const json& params) {
    if (!params.is_object()) {
        return ToolError{ErrorKind::MISSING_TOOL_NAME, "Missing tool name"};
    }
    auto it = params.find("name");
    if (it == params.end() || !it->is_string()) {
        return ToolError{ErrorKind::MISSING_TOOL_NAME, "Missing tool name"};
    }
    return it->get<std::string>();
}

Result<ToolArguments> extract_arguments(const json& params) {
    auto it = params.find("arguments");
    if (it == params.end() || it->is_null()) {
        return ToolArguments{};
    }
    if (!it->is_object()) {
        return ToolError{ErrorKind::INVALID_ARGUMENTS,
            std::string("Tool arguments must be an object, got ") + it->type_name()};
    }
    return ToolArguments::from_json(*it);
}

} // anonymous namespace

RequestDispatcher::RequestDispatcher(std::shared_ptr<const ToolRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("Tool registry cannot be null");
    }
}

Response RequestDispatcher::dispatch(const Request& request) const {
    spdlog::debug("Handling request: method={}, id={}", request.method,
                  request.id ? request.id->dump() : "<none>");

    Result<json> outcome;
    try {
        outcome = route(request);
    } catch (const std::exception& e) {
        // Library exceptions (e.g. nlohmann type errors) are reported like handler failures
        outcome = ToolError{ErrorKind::TOOL_EXECUTION_FAILED, e.what()};
    }

    if (auto* err = std::get_if<ToolError>(&outcome)) {
        spdlog::warn("Request {} failed ({}): {}", request.method, to_string(err->kind), err->message);
        return Response::failure(request.id, Error{error_code::INTERNAL_ERROR, err->message, std::nullopt});
    }

    return Response::success(request.id, std::move(std::get<json>(outcome)));
}

Result<json> RequestDispatcher::route(const Request& request) const {
    if (request.method == "initialize") {
        return handle_initialize();
    } else if (request.method == "tools/list") {
        return handle_tools_list();
    } else if (request.method == "tools/call") {
        return handle_tools_call(request.params);
    }
    return ToolError{ErrorKind::UNKNOWN_METHOD, "Unknown method: " + request.method};
}

Result<json> RequestDispatcher::handle_initialize() const {
    spdlog::info("Handling initialize request");

    return json{
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", SERVER_NAME},
            {"version", SERVER_VERSION}
        }}
    };
}

Result<json> RequestDispatcher::handle_tools_list() const {
    json tools_array = json::array();

    for (const auto& info : registry_->list_tools()) {
        tools_array.push_back(info.to_json());
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return json{{"tools", tools_array}};
}

Result<json> RequestDispatcher::handle_tools_call(const std::optional<json>& params) const {
    if (!params) {
        return ToolError{ErrorKind::MISSING_PARAMS, "Missing params"};
    }

    auto name = extract_tool_name(*params);
    if (auto* err = std::get_if<ToolError>(&name)) {
        return *err;
    }

    auto arguments = extract_arguments(*params);
    if (auto* err = std::get_if<ToolError>(&arguments)) {
        return *err;
    }

    return registry_->invoke(std::get<std::string>(name), std::get<ToolArguments>(arguments));
}

} // namespace dg_mcp
