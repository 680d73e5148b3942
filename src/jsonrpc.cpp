#include "jsonrpc.hpp"

namespace mcp_tools {

namespace {

bool valid_id(const nlohmann::json& id) {
    return id.is_null() || id.is_string() || id.is_number_integer();
}

} // namespace

RpcRequest parse_request(const nlohmann::json& message) {
    if (!message.is_object()) {
        throw RpcError(kInvalidRequest, "Invalid Request: expected a JSON object");
    }

    RpcRequest req;
    auto id_it = message.find("id");
    if (id_it == message.end()) {
        req.is_notification = true;
    } else if (valid_id(*id_it)) {
        req.id = *id_it;
    } else {
        throw RpcError(kInvalidRequest, "Invalid Request: id must be a string, integer or null");
    }

    auto version_it = message.find("jsonrpc");
    if (version_it == message.end() || !version_it->is_string() || *version_it != kJsonRpcVersion) {
        throw RpcError(kInvalidRequest, "Invalid Request: jsonrpc must be \"2.0\"", req.id);
    }

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        throw RpcError(kInvalidRequest, "Invalid Request: method must be a string", req.id);
    }
    req.method = method_it->get<std::string>();

    auto params_it = message.find("params");
    if (params_it != message.end() && !params_it->is_null()) {
        if (!params_it->is_object() && !params_it->is_array()) {
            throw RpcError(kInvalidRequest, "Invalid Request: params must be an object or array", req.id);
        }
        req.params = *params_it;
    }

    return req;
}

nlohmann::json success_response(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json error_response(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

} // namespace mcp_tools
