#include "groups_api.hpp"
#include "errors.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace mcp_tools {

namespace {

const std::array<const char*, 2> kRecordKeys = {"groups", "data"};

int read_int_arg(const nlohmann::json& args, const char* key, int fallback) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) return fallback;

    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        v = std::clamp<int64_t>(v, std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
        return static_cast<int>(v);
    }
    if (it->is_number_float()) {
        double d = std::clamp<double>(it->get<double>(), std::numeric_limits<int>::min(),
                                      std::numeric_limits<int>::max());
        if (d == std::trunc(d)) {
            return static_cast<int>(d);
        }
    }
    throw InvalidParams(std::string("Parameter '") + key + "' must be an integer");
}

int64_t read_int_field(const nlohmann::json& obj, const char* key, int64_t fallback) {
    if (!obj.is_object()) return fallback;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer()) return fallback;
    return it->get<int64_t>();
}

std::optional<std::string> id_as_string(const nlohmann::json& id) {
    if (id.is_string()) return id.get<std::string>();
    if (id.is_number_integer()) return id.dump();
    return std::nullopt;
}

} // namespace

PageRequest PageRequest::from_args(const nlohmann::json& args) {
    PageRequest req;
    if (!args.is_object()) return req;

    req.page = std::max(1, read_int_arg(args, "page", kDefaultPage));
    req.limit = std::clamp(read_int_arg(args, "limit", kDefaultLimit), 1, kMaxLimit);

    auto it = args.find("search");
    if (it != args.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw InvalidParams("Parameter 'search' must be a string");
        }
        req.search = it->get<std::string>();
    }
    return req;
}

const nlohmann::json* match_group_records(const nlohmann::json& body) {
    if (!body.is_object()) return nullptr;
    for (const char* key : kRecordKeys) {
        auto it = body.find(key);
        if (it != body.end() && it->is_array()) {
            return &*it;
        }
    }
    return nullptr;
}

GroupsView build_groups_view(const nlohmann::json& records) {
    GroupsView view;
    if (!records.is_array()) return view;

    for (const auto& record : records) {
        if (!record.is_object()) continue;

        auto name_it = record.find("name");
        auto id_it = record.find("id");
        if (name_it == record.end() || id_it == record.end() || !name_it->is_string()) continue;

        auto id = id_as_string(*id_it);
        if (!id) continue;

        view[name_it->get<std::string>()] = *id;
    }
    return view;
}

Pagination compute_pagination(const nlohmann::json& body, const PageRequest& request,
                              std::size_t record_count) {
    Pagination p;
    p.page = request.page;
    p.limit = request.limit;
    p.total = static_cast<int64_t>(record_count);

    if (body.is_object()) {
        p.total = read_int_field(body, "total", p.total);

        auto page_it = body.find("page");
        if (page_it != body.end() && page_it->is_object()) {
            p.page = read_int_field(*page_it, "pageIndex", p.page);
            p.limit = read_int_field(*page_it, "pageSize", p.limit);
            p.total = read_int_field(*page_it, "total", p.total);
        }
    }

    p.total = std::max<int64_t>(0, p.total);
    if (p.limit > 0) {
        p.total_pages = std::max<int64_t>(1, p.total / p.limit + (p.total % p.limit != 0 ? 1 : 0));
    } else {
        p.total_pages = 1;
    }
    p.has_next = p.page < p.total_pages;
    p.has_previous = p.page > 1;
    return p;
}

ApiOutcome fetch_groups(const ApiClient& client, const PageRequest& request) {
    KeyValueList query = {
        {"page", std::to_string(request.page)},
        {"limit", std::to_string(request.limit)}
    };
    if (!request.search.empty()) {
        query.emplace_back("search", request.search);
    }

    ServerLog::log("Groups", "Fetching groups: page=" + std::to_string(request.page) +
                   ", limit=" + std::to_string(request.limit) +
                   (request.search.empty() ? "" : ", search=" + request.search));

    ApiOutcome outcome = client.get_json("/groups", query);
    if (!outcome.ok()) return outcome;

    const nlohmann::json& body = outcome.payload;
    if (!body.is_object()) {
        return ApiOutcome::failure(ApiStatus::MalformedResponse, "Invalid JSON response from API", 200);
    }

    const nlohmann::json* matched = match_group_records(body);
    nlohmann::json records = matched ? *matched : nlohmann::json::array();
    if (!matched) {
        ServerLog::warn("Groups", "Response has neither 'groups' nor 'data' array");
    }

    GroupsView view = build_groups_view(records);
    Pagination pagination = compute_pagination(body, request, records.size());

    nlohmann::json result;
    result["groups"] = view;
    result["groups_count"] = view.size();
    result["original_groups_array"] = records;
    result["pagination"] = pagination.to_json();
    result["search"] = request.search.empty() ? nlohmann::json(nullptr) : nlohmann::json(request.search);
    result["timestamp"] = utc_timestamp();
    result["success"] = true;

    ServerLog::log("Groups", "Mapped " + std::to_string(view.size()) + " of " +
                   std::to_string(records.size()) + " records to name->id");
    return ApiOutcome::success(std::move(result));
}

ApiOutcome fetch_user_count(const ApiClient& client, const std::string& group_id) {
    if (group_id.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ToolError("group_id parameter is required and cannot be empty");
    }

    StatusMessages messages;
    messages.forbidden = "Access forbidden. Check your permissions for this group.";
    messages.not_found = "Group not found or memberships endpoint not accessible for group ID: " + group_id;

    ServerLog::log("Groups", "Fetching user count for group " + group_id);

    ApiOutcome outcome = client.get_json("/group-memberships",
        {{"groupId", group_id}, {"pageIndex", "1"}, {"pageSize", "0"}}, messages);
    if (!outcome.ok()) return outcome;

    const nlohmann::json& body = outcome.payload;
    int64_t total = read_int_field(body, "total", 0);
    if (body.is_object() && body.contains("page")) {
        total = read_int_field(body["page"], "total", total);
    }

    nlohmann::json result;
    result["group_id"] = group_id;
    result["user_count"] = total;
    result["timestamp"] = utc_timestamp();
    result["success"] = true;
    return ApiOutcome::success(std::move(result));
}

} // namespace mcp_tools
