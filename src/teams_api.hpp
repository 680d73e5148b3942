#pragma once

#include "api_client.hpp"
#include <string>

namespace mcp_tools {

// GET {endpoint}/repos/{org}/{repo}/teams and collect team names.
// Throws ToolError for a blank repo slug or a missing organization.
ApiOutcome fetch_repo_teams(const ApiClient& client, const std::string& org, const std::string& repo_slug);

} // namespace mcp_tools
