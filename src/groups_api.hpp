#pragma once

#include "api_client.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_tools {

struct PageRequest {
    static constexpr int kDefaultPage = 1;
    static constexpr int kDefaultLimit = 10;
    static constexpr int kMaxLimit = 100;

    int page = kDefaultPage;
    int limit = kDefaultLimit;
    std::string search;

    // Reads page/limit/search from tool arguments. Non-integer page or
    // limit throws InvalidParams; out-of-range values are clamped.
    static PageRequest from_args(const nlohmann::json& args);
};

struct Pagination {
    int64_t page = 1;
    int64_t limit = PageRequest::kDefaultLimit;
    int64_t total = 0;
    int64_t total_pages = 1;
    bool has_next = false;
    bool has_previous = false;

    nlohmann::json to_json() const {
        return {
            {"page", page},
            {"limit", limit},
            {"total", total},
            {"total_pages", total_pages},
            {"has_next", has_next},
            {"has_previous", has_previous}
        };
    }
};

// name -> id. Duplicate names keep the id of the last record seen.
using GroupsView = std::map<std::string, std::string>;

// Locate the record array in a decoded body. Shapes are tried in order
// ("groups", then "data") and the first key holding an array wins, so a
// body carrying both reports "groups". Returns nullptr when no shape
// matches.
const nlohmann::json* match_group_records(const nlohmann::json& body);

// Records missing a string name or a string/integer id are skipped
GroupsView build_groups_view(const nlohmann::json& records);

// Page/limit/total come from the payload's "page" object or top-level
// "total" when present, otherwise from the request and the array size.
Pagination compute_pagination(const nlohmann::json& body, const PageRequest& request,
                              std::size_t record_count);

// GET {endpoint}/groups and shape the result
ApiOutcome fetch_groups(const ApiClient& client, const PageRequest& request);

// GET {endpoint}/group-memberships?groupId=... and report page.total.
// A blank group id throws ToolError before any request is made.
ApiOutcome fetch_user_count(const ApiClient& client, const std::string& group_id);

} // namespace mcp_tools
