#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_tools {

constexpr const char* kJsonRpcVersion = "2.0";

// Standard JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

struct RpcRequest {
    nlohmann::json id;                // string, integer or null
    bool is_notification = false;     // No "id" member at all
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

// Protocol-level failure carrying the code and the id to answer with
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message, nlohmann::json id = nullptr)
        : std::runtime_error(message), code_(code), id_(std::move(id)) {}

    int code() const { return code_; }
    const nlohmann::json& id() const { return id_; }

private:
    int code_;
    nlohmann::json id_;
};

// Validate the envelope of a decoded message. Throws RpcError(kInvalidRequest).
RpcRequest parse_request(const nlohmann::json& message);

nlohmann::json success_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json error_response(const nlohmann::json& id, int code, const std::string& message);

} // namespace mcp_tools
