#include "teams_api.hpp"
#include "errors.hpp"
#include "server_log.hpp"

namespace mcp_tools {

namespace {

const char* kSlugChars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789._-";

} // namespace

ApiOutcome fetch_repo_teams(const ApiClient& client, const std::string& org, const std::string& repo_slug) {
    if (repo_slug.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ToolError("repo_slug parameter is required and cannot be empty");
    }
    // The slug becomes a URL path segment
    if (repo_slug.find_first_not_of(kSlugChars) != std::string::npos || repo_slug == "." || repo_slug == "..") {
        throw ToolError("repo_slug may only contain letters, digits, '.', '-' and '_'");
    }
    if (auto config_error = client.check_config()) {
        return *config_error;
    }
    if (org.empty()) {
        return ApiOutcome::failure(ApiStatus::ConfigError, "GITHUB_ORG_NAME not configured");
    }

    ServerLog::log("Teams", "Fetching teams for " + org + "/" + repo_slug);

    ApiOutcome outcome = client.get_json("/repos/" + org + "/" + repo_slug + "/teams", {});
    if (!outcome.ok()) return outcome;

    if (!outcome.payload.is_array()) {
        return ApiOutcome::failure(ApiStatus::MalformedResponse, "Invalid JSON response from API", 200);
    }

    nlohmann::json teams = nlohmann::json::array();
    for (const auto& team : outcome.payload) {
        if (team.is_object() && team.contains("name") && team["name"].is_string()) {
            teams.push_back(team["name"]);
        }
    }

    nlohmann::json result;
    result["repo"] = repo_slug;
    result["teams"] = teams;
    result["team_count"] = teams.size();
    result["timestamp"] = utc_timestamp();
    result["success"] = true;
    return ApiOutcome::success(std::move(result));
}

} // namespace mcp_tools
