#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_tools {

enum class ApiStatus : int {
    Success,
    AuthError,
    Forbidden,
    NotFound,
    RateLimited,
    ServerError,
    NetworkError,
    MalformedResponse,
    ConfigError
};

inline std::string api_status_to_string(ApiStatus s) {
    switch (s) {
        case ApiStatus::Success: return "success";
        case ApiStatus::AuthError: return "auth_error";
        case ApiStatus::Forbidden: return "forbidden";
        case ApiStatus::NotFound: return "not_found";
        case ApiStatus::RateLimited: return "rate_limited";
        case ApiStatus::ServerError: return "server_error";
        case ApiStatus::NetworkError: return "network_error";
        case ApiStatus::MalformedResponse: return "malformed_response";
        case ApiStatus::ConfigError: return "config_error";
        default: return "unknown";
    }
}

// Result of one proxied call. A payload is only ever carried on success.
struct ApiOutcome {
    ApiStatus status = ApiStatus::Success;
    nlohmann::json payload;
    std::optional<int> status_code;
    std::string message;

    bool ok() const { return status == ApiStatus::Success; }

    static ApiOutcome success(nlohmann::json payload) {
        ApiOutcome outcome;
        outcome.payload = std::move(payload);
        return outcome;
    }

    static ApiOutcome failure(ApiStatus status, std::string message,
                              std::optional<int> status_code = std::nullopt) {
        ApiOutcome outcome;
        outcome.status = status;
        outcome.message = std::move(message);
        outcome.status_code = status_code;
        return outcome;
    }

    // Payload on success, {"error", "error_type", "status_code"?, "success": false} otherwise
    nlohmann::json to_json() const {
        if (ok()) return payload;

        nlohmann::json j;
        j["error"] = message;
        j["error_type"] = api_status_to_string(status);
        if (status_code) j["status_code"] = *status_code;
        j["success"] = false;
        return j;
    }
};

// Human messages for the statuses whose wording depends on the endpoint
struct StatusMessages {
    std::string forbidden = "Access forbidden. Check your permissions.";
    std::string not_found = "API endpoint not found. Check your API URL.";
};

// Map a transport reply onto an outcome. A 200 body is decoded as JSON.
ApiOutcome classify_reply(const HttpReply& reply, const StatusMessages& messages = {});

// Authenticated JSON GETs against one configured endpoint
class ApiClient {
public:
    ApiClient(const ApiSettings& settings, HttpGet transport);

    // ConfigError outcome when the endpoint or token is missing
    std::optional<ApiOutcome> check_config() const;

    // Validates configuration first; no request is made when it fails
    ApiOutcome get_json(const std::string& path, const KeyValueList& query,
                        const StatusMessages& messages = {}) const;

private:
    const ApiSettings& settings_;
    HttpGet transport_;
};

// Current UTC time as ISO-8601, e.g. "2025-10-27T22:55:00Z"
std::string utc_timestamp();

} // namespace mcp_tools
