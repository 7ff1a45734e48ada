#include "JsonRpc.hpp"

namespace dg_mcp {

Response Response::success(std::optional<json> id, json result) {
    Response response;
    response.id_ = std::move(id);
    response.result_ = std::move(result);
    return response;
}

Response Response::failure(std::optional<json> id, Error error) {
    Response response;
    response.id_ = std::move(id);
    response.error_ = std::move(error);
    return response;
}

json Response::to_json() const {
    json message = {{"jsonrpc", JSONRPC_VERSION}};

    if (id_) {
        message["id"] = *id_;
    }

    if (error_) {
        json error = {
            {"code", error_->code},
            {"message", error_->message}
        };
        if (error_->data) {
            error["data"] = *error_->data;
        }
        message["error"] = std::move(error);
    } else {
        message["result"] = result_;
    }

    return message;
}

} // namespace dg_mcp
