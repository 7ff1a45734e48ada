#include "MessageCodec.hpp"

namespace dg_mcp {

DecodeResult MessageCodec::decode(std::string_view line) {
    json message;
    try {
        message = json::parse(line.begin(), line.end());
    } catch (const json::parse_error& e) {
        return DecodeFailure{std::string("JSON parse error: ") + e.what()};
    }

    if (!message.is_object()) {
        return DecodeFailure{std::string("Message must be a JSON object, got ") + message.type_name()};
    }

    auto jsonrpc_it = message.find("jsonrpc");
    if (jsonrpc_it == message.end() || !jsonrpc_it->is_string() || *jsonrpc_it != JSONRPC_VERSION) {
        return DecodeFailure{"Invalid Request: missing or invalid jsonrpc field"};
    }

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        return DecodeFailure{"Invalid Request: method must be a string"};
    }

    Request request;
    request.method = method_it->get<std::string>();

    auto id_it = message.find("id");
    if (id_it != message.end()) {
        if (!id_it->is_string() && !id_it->is_number() && !id_it->is_null()) {
            return DecodeFailure{std::string("Invalid Request: id must be string, number or null, got ")
                + id_it->type_name()};
        }
        request.id = *id_it;
    }

    auto params_it = message.find("params");
    if (params_it != message.end() && !params_it->is_null()) {
        request.params = *params_it;
    }

    return request;
}

std::string MessageCodec::encode(const Response& response) {
    // Non-indented dump escapes control characters, so the output is one line
    return response.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace dg_mcp
