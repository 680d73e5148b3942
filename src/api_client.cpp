#include "api_client.hpp"
#include "server_log.hpp"
#include <chrono>
#include <ctime>

namespace mcp_tools {

ApiOutcome classify_reply(const HttpReply& reply, const StatusMessages& messages) {
    switch (reply.error) {
        case TransportError::None:
            break;
        case TransportError::Timeout:
            return ApiOutcome::failure(ApiStatus::NetworkError, "API request timed out. Please try again.");
        case TransportError::InvalidUrl:
            return ApiOutcome::failure(ApiStatus::ConfigError, "API endpoint is not a usable http(s) URL");
        case TransportError::ConnectionFailed:
        default:
            return ApiOutcome::failure(ApiStatus::NetworkError, "Failed to connect to API");
    }

    switch (reply.status) {
        case 200: {
            auto body = nlohmann::json::parse(reply.body, nullptr, false);
            if (body.is_discarded()) {
                return ApiOutcome::failure(ApiStatus::MalformedResponse, "Invalid JSON response from API", 200);
            }
            return ApiOutcome::success(std::move(body));
        }
        case 401:
            return ApiOutcome::failure(ApiStatus::AuthError,
                                       "Authentication failed. Please check your bearer token.", 401);
        case 403:
            return ApiOutcome::failure(ApiStatus::Forbidden, messages.forbidden, 403);
        case 404:
            return ApiOutcome::failure(ApiStatus::NotFound, messages.not_found, 404);
        case 429:
            return ApiOutcome::failure(ApiStatus::RateLimited,
                                       "Rate limit exceeded. Please wait and try again.", 429);
        default:
            // 5xx and every other unexpected status
            return ApiOutcome::failure(ApiStatus::ServerError,
                                       "API request failed with status " + std::to_string(reply.status),
                                       reply.status);
    }
}

ApiClient::ApiClient(const ApiSettings& settings, HttpGet transport)
    : settings_(settings), transport_(std::move(transport))
{
}

std::optional<ApiOutcome> ApiClient::check_config() const {
    if (settings_.endpoint.empty()) {
        return ApiOutcome::failure(ApiStatus::ConfigError, settings_.endpoint_var + " not configured");
    }
    if (settings_.bearer_token.empty()) {
        return ApiOutcome::failure(ApiStatus::ConfigError, settings_.token_var + " not configured");
    }
    return std::nullopt;
}

ApiOutcome ApiClient::get_json(const std::string& path, const KeyValueList& query,
                               const StatusMessages& messages) const {
    if (auto config_error = check_config()) {
        ServerLog::warn("API", config_error->message);
        return *config_error;
    }

    HttpGetRequest req;
    req.base_url = settings_.endpoint;
    req.path = path;
    req.query = query;
    req.headers = {
        {"Authorization", "Bearer " + settings_.bearer_token},
        {"Accept", "application/json"}
    };
    req.timeout_seconds = settings_.timeout_seconds;

    ServerLog::log("API", "GET " + settings_.endpoint + path);
    ApiOutcome outcome = classify_reply(transport_(req), messages);

    if (!outcome.ok()) {
        ServerLog::error("API", "GET " + path + " -> " + api_status_to_string(outcome.status) +
                         (outcome.status_code ? " (" + std::to_string(*outcome.status_code) + ")" : ""));
    }
    return outcome;
}

std::string utc_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

} // namespace mcp_tools
