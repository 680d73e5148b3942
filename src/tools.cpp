#include "tools.hpp"
#include "api_client.hpp"
#include "file_lister.hpp"
#include "groups_api.hpp"
#include "path_resolver.hpp"
#include "server_log.hpp"
#include "teams_api.hpp"
#include "weather.hpp"
#include <algorithm>
#include <memory>

namespace mcp_tools {

namespace {

ParamSpec string_param(const std::string& name, const std::string& description, bool required) {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::String;
    p.required = required;
    p.description = description;
    return p;
}

ParamSpec integer_param(const std::string& name, const std::string& description,
                        int64_t default_value, int64_t minimum, std::optional<int64_t> maximum) {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::Integer;
    p.default_value = default_value;
    p.description = description;
    p.minimum = minimum;
    p.maximum = maximum;
    return p;
}

// Tool implementations

ToolDescriptor list_files_tool(const ServerConfig& config) {
    ToolDescriptor tool;
    tool.name = "list_files";
    tool.description =
        "List all files and directories in the specified folder path.\n\n"
        "Accepts absolute or relative paths. When the server runs in container mode, "
        "Windows drive paths such as C:\\Users\\me are translated to the mounted host drive.\n\n"
        "RETURNS: {path, total_items, files[], success, error} where each file has "
        "name, path, type (file|directory), size (null for directories) and modified (Unix time).";
    tool.params = {
        string_param("folder_path", "The absolute or relative path to the directory to list", true)
    };

    const PathSettings& paths = config.paths;
    tool.handler = [&paths](const nlohmann::json& args) {
        const std::string folder = args["folder_path"].get<std::string>();

        try {
            auto resolved = resolve_path(folder, paths);
            ServerLog::log("Files", "Listing files in: " + resolved.string());
            return list_directory(resolved, folder).to_json();
        } catch (const InvalidPath& e) {
            ServerLog::warn("Files", e.what());
            DirectoryListing listing;
            listing.path = folder;
            listing.error = e.what();
            return listing.to_json();
        }
    };
    return tool;
}

ToolDescriptor weather_tool() {
    ToolDescriptor tool;
    tool.name = "get_weather";
    tool.description =
        "Get current weather for a city (demo mode: static sample data).\n\n"
        "RETURNS: {location, current, condition, wind, units, timestamp, source, success}.";

    ParamSpec units = string_param("units", "Unit system for the returned labels", false);
    units.default_value = "metric";
    units.allowed = {"metric", "imperial", "kelvin"};

    ParamSpec country = string_param("country_code", "Optional 2-letter country code (e.g. US, UK, CA)", false);
    country.default_value = "";

    tool.params = {
        string_param("city", "The name of the city", true),
        country,
        units
    };
    tool.handler = [](const nlohmann::json& args) {
        auto city = args["city"].get<std::string>();
        auto country_code = args["country_code"].get<std::string>();
        auto units = string_to_unit_system(args["units"].get<std::string>());

        ServerLog::log("Weather", "Current weather for " + city);
        return current_weather(city, country_code, units);
    };
    return tool;
}

ToolDescriptor forecast_tool() {
    ToolDescriptor tool;
    tool.name = "get_weather_forecast";
    tool.description =
        "Get a weather forecast for a city (demo mode: static sample data).\n\n"
        "RETURNS: {location, forecast[], forecast_days, timestamp, source, success}.";

    ParamSpec country = string_param("country_code", "Optional 2-letter country code (e.g. US, UK, CA)", false);
    country.default_value = "";

    tool.params = {
        string_param("city", "The name of the city", true),
        country,
        integer_param("days", "Number of forecast days, clamped to 1-5", 5, 1, 5)
    };
    tool.handler = [](const nlohmann::json& args) {
        auto city = args["city"].get<std::string>();
        auto country_code = args["country_code"].get<std::string>();
        auto days = args["days"].get<int64_t>();
        int clamped = static_cast<int>(std::clamp<int64_t>(days, 1, 5));

        ServerLog::log("Weather", std::to_string(clamped) + "-day forecast for " + city);
        return weather_forecast(city, country_code, clamped);
    };
    return tool;
}

ToolDescriptor groups_tool(std::shared_ptr<const ApiClient> client) {
    ToolDescriptor tool;
    tool.name = "get_groups";
    tool.description =
        "Retrieve groups from the configured API with pagination and optional search.\n\n"
        "Groups are returned as a map of group name to group id. Records without a name or id "
        "are left out of the map but kept in original_groups_array.\n\n"
        "RETURNS: {groups, groups_count, original_groups_array, pagination, search, timestamp, success}.";
    tool.params = {
        integer_param("page", "Page number (1-based)", PageRequest::kDefaultPage, 1, std::nullopt),
        integer_param("limit", "Groups per page, clamped to 1-100",
                      PageRequest::kDefaultLimit, 1, PageRequest::kMaxLimit),
        string_param("search", "Optional search term to filter groups", false)
    };
    tool.handler = [client](const nlohmann::json& args) {
        return fetch_groups(*client, PageRequest::from_args(args)).to_json();
    };
    return tool;
}

ToolDescriptor user_count_tool(std::shared_ptr<const ApiClient> client) {
    ToolDescriptor tool;
    tool.name = "get_usercount";
    tool.description =
        "Get the number of users in a group from the group memberships API.\n\n"
        "RETURNS: {group_id, user_count, timestamp, success}.";
    tool.params = {
        string_param("group_id", "The ID of the group to count users for", true)
    };
    tool.handler = [client](const nlohmann::json& args) {
        auto group_id = args["group_id"].get<std::string>();
        nlohmann::json result = fetch_user_count(*client, group_id).to_json();
        result["group_id"] = group_id;
        return result;
    };
    return tool;
}

ToolDescriptor repo_teams_tool(std::shared_ptr<const ApiClient> client, const std::string& org) {
    ToolDescriptor tool;
    tool.name = "get_repoteams";
    tool.description =
        "List the teams that have access to a repository in the configured GitHub organization.\n\n"
        "RETURNS: {repo, teams[], team_count, timestamp, success}.";
    tool.params = {
        string_param("repo_slug", "The repository name", true)
    };
    tool.handler = [client, org](const nlohmann::json& args) {
        auto repo = args["repo_slug"].get<std::string>();
        nlohmann::json result = fetch_repo_teams(*client, org, repo).to_json();
        result["repo"] = repo;
        return result;
    };
    return tool;
}

} // namespace

ToolRegistry build_tool_registry(const ServerConfig& config, HttpGet transport) {
    auto groups_client = std::make_shared<const ApiClient>(config.groups_api, transport);
    auto github_client = std::make_shared<const ApiClient>(config.github_api, transport);

    std::vector<ToolDescriptor> tools;
    tools.push_back(list_files_tool(config));
    tools.push_back(weather_tool());
    tools.push_back(forecast_tool());
    tools.push_back(groups_tool(groups_client));
    tools.push_back(user_count_tool(groups_client));
    tools.push_back(repo_teams_tool(github_client, config.github_org));
    return ToolRegistry(std::move(tools));
}

} // namespace mcp_tools
