#pragma once

#include <map>
#include <string>

namespace mcp_tools {

// Host-to-container path translation
struct PathSettings {
    bool container_mode = false;
    std::string mount_root = "/host";
};

// One authenticated REST endpoint. The *_var fields name the environment
// variables the values came from so error messages can point at them.
struct ApiSettings {
    std::string endpoint;
    std::string bearer_token;
    std::string endpoint_var;
    std::string token_var;
    int timeout_seconds = 30;
};

// Process-wide configuration. Built once in main() and never mutated.
struct ServerConfig {
    ApiSettings groups_api;
    ApiSettings github_api;
    std::string github_org;
    PathSettings paths;
};

// Read configuration from the process environment
ServerConfig load_config_from_env();

// Parse KEY=VALUE lines from a .env file. Missing file yields an empty map.
std::map<std::string, std::string> read_env_file(const std::string& path);

// Export entries from a .env file without overriding variables that are
// already set. Returns the number of variables exported.
int apply_env_file(const std::string& path);

bool parse_bool(const std::string& value, bool fallback);

} // namespace mcp_tools
