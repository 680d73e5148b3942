#include <catch2/catch_test_macros.hpp>
#include "api_client.hpp"
#include "test_helpers.hpp"

using namespace mcp_tools;
using mcp_tools::testing::FakeTransport;
using mcp_tools::testing::QuietLog;

namespace {

HttpReply reply_with(int status, const std::string& body = "{}") {
    HttpReply reply;
    reply.status = status;
    reply.body = body;
    return reply;
}

ApiSettings groups_settings() {
    ApiSettings s;
    s.endpoint = "https://groups.example.com/api";
    s.bearer_token = "tok-123";
    s.endpoint_var = "API_ENDPOINT";
    s.token_var = "BEARER_TOKEN";
    s.timeout_seconds = 7;
    return s;
}

} // namespace

TEST_CASE("Reply classification", "[api]") {
    SECTION("200 with JSON body") {
        auto outcome = classify_reply(reply_with(200, R"({"groups": []})"));
        REQUIRE(outcome.ok());
        REQUIRE(outcome.payload["groups"].is_array());
        REQUIRE_FALSE(outcome.status_code.has_value());
    }

    SECTION("200 with a body that is not JSON") {
        auto outcome = classify_reply(reply_with(200, "<html>"));
        REQUIRE(outcome.status == ApiStatus::MalformedResponse);
        REQUIRE(outcome.message == "Invalid JSON response from API");
        REQUIRE(outcome.status_code == 200);
    }

    SECTION("HTTP status codes") {
        REQUIRE(classify_reply(reply_with(401)).status == ApiStatus::AuthError);
        REQUIRE(classify_reply(reply_with(401)).message ==
                "Authentication failed. Please check your bearer token.");
        REQUIRE(classify_reply(reply_with(403)).status == ApiStatus::Forbidden);
        REQUIRE(classify_reply(reply_with(404)).status == ApiStatus::NotFound);
        REQUIRE(classify_reply(reply_with(404)).message == "API endpoint not found. Check your API URL.");
        REQUIRE(classify_reply(reply_with(429)).status == ApiStatus::RateLimited);

        auto server = classify_reply(reply_with(503));
        REQUIRE(server.status == ApiStatus::ServerError);
        REQUIRE(server.status_code == 503);
        REQUIRE(server.message == "API request failed with status 503");

        // Only 200 counts as success
        REQUIRE(classify_reply(reply_with(204)).status == ApiStatus::ServerError);
        REQUIRE(classify_reply(reply_with(302)).status == ApiStatus::ServerError);
    }

    SECTION("Endpoint-specific wording") {
        StatusMessages messages;
        messages.not_found = "Group not found";
        REQUIRE(classify_reply(reply_with(404), messages).message == "Group not found");
    }

    SECTION("Transport failures") {
        HttpReply timeout;
        timeout.error = TransportError::Timeout;
        auto t = classify_reply(timeout);
        REQUIRE(t.status == ApiStatus::NetworkError);
        REQUIRE(t.message == "API request timed out. Please try again.");

        HttpReply refused;
        refused.error = TransportError::ConnectionFailed;
        REQUIRE(classify_reply(refused).message == "Failed to connect to API");

        HttpReply bad_url;
        bad_url.error = TransportError::InvalidUrl;
        REQUIRE(classify_reply(bad_url).status == ApiStatus::ConfigError);
    }
}

TEST_CASE("Outcome JSON", "[api]") {
    auto ok = ApiOutcome::success({{"success", true}, {"n", 1}});
    REQUIRE(ok.to_json()["n"] == 1);

    auto failed = ApiOutcome::failure(ApiStatus::RateLimited, "slow down", 429);
    auto j = failed.to_json();
    REQUIRE(j["success"] == false);
    REQUIRE(j["error"] == "slow down");
    REQUIRE(j["error_type"] == "rate_limited");
    REQUIRE(j["status_code"] == 429);

    auto no_code = ApiOutcome::failure(ApiStatus::NetworkError, "down").to_json();
    REQUIRE_FALSE(no_code.contains("status_code"));
    REQUIRE(no_code["error_type"] == "network_error");
}

TEST_CASE("Authenticated GET", "[api]") {
    QuietLog quiet;
    FakeTransport transport;
    ApiSettings settings = groups_settings();
    ApiClient client(settings, transport.get());

    SECTION("Request carries bearer token, accept header and timeout") {
        transport.respond(200, R"({"ok": true})");
        auto outcome = client.get_json("/groups", {{"page", "1"}});
        REQUIRE(outcome.ok());
        REQUIRE(transport.calls() == 1);

        const auto& req = transport.last();
        REQUIRE(req.base_url == "https://groups.example.com/api");
        REQUIRE(req.path == "/groups");
        REQUIRE(req.timeout_seconds == 7);
        REQUIRE(mcp_tools::testing::query_value(req, "page") == "1");

        bool saw_auth = false;
        bool saw_accept = false;
        for (const auto& [key, value] : req.headers) {
            if (key == "Authorization") saw_auth = value == "Bearer tok-123";
            if (key == "Accept") saw_accept = value == "application/json";
        }
        REQUIRE(saw_auth);
        REQUIRE(saw_accept);
    }

    SECTION("Missing token fails without touching the network") {
        settings.bearer_token.clear();
        auto outcome = client.get_json("/groups", {});
        REQUIRE(outcome.status == ApiStatus::ConfigError);
        REQUIRE(outcome.message == "BEARER_TOKEN not configured");
        REQUIRE(transport.calls() == 0);
    }

    SECTION("Missing endpoint fails without touching the network") {
        settings.endpoint.clear();
        auto outcome = client.get_json("/groups", {});
        REQUIRE(outcome.status == ApiStatus::ConfigError);
        REQUIRE(outcome.message == "API_ENDPOINT not configured");
        REQUIRE(transport.calls() == 0);
    }

    SECTION("Token never appears in failures") {
        for (int status : {401, 403, 404, 429, 500}) {
            transport.respond(status, "tok-123");
            auto j = client.get_json("/groups", {}).to_json();
            REQUIRE(j.dump().find("tok-123") == std::string::npos);
        }
    }
}

TEST_CASE("Log output never carries the token", "[api][log]") {
    std::string captured;
    ServerLog::set_sink([&captured](const std::string& component, const std::string& message, LogLevel) {
        captured += component + " " + message + "\n";
    });

    FakeTransport transport;
    transport.respond(401, "");
    ApiSettings settings = groups_settings();
    ApiClient client(settings, transport.get());
    auto outcome = client.get_json("/groups", {});

    ServerLog::set_sink(nullptr);

    REQUIRE(outcome.status == ApiStatus::AuthError);
    REQUIRE_FALSE(captured.empty());
    REQUIRE(captured.find("tok-123") == std::string::npos);
}

TEST_CASE("Base URL handling", "[api][http]") {
    SECTION("Origin and base path are split") {
        auto url = split_base_url("https://api.example.com:8443/v1/");
        REQUIRE(url.has_value());
        REQUIRE(url->scheme_host_port == "https://api.example.com:8443");
        REQUIRE(url->base_path == "/v1");
    }

    SECTION("Origin only") {
        auto url = split_base_url("http://localhost:8080");
        REQUIRE(url.has_value());
        REQUIRE(url->scheme_host_port == "http://localhost:8080");
        REQUIRE(url->base_path.empty());
    }

    SECTION("Unusable URLs") {
        REQUIRE_FALSE(split_base_url("ftp://example.com").has_value());
        REQUIRE_FALSE(split_base_url("example.com/api").has_value());
        REQUIRE_FALSE(split_base_url("https:///nohost").has_value());
    }

    SECTION("Path joining") {
        REQUIRE(join_url_path("", "/groups") == "/groups");
        REQUIRE(join_url_path("", "groups") == "/groups");
        REQUIRE(join_url_path("/v1", "/groups") == "/v1/groups");
        REQUIRE(join_url_path("/v1/", "/groups") == "/v1/groups");
        REQUIRE(join_url_path("/v1", "groups") == "/v1/groups");
        REQUIRE(join_url_path("/v1", "") == "/v1");
    }
}

TEST_CASE("UTC timestamps", "[api]") {
    auto ts = utc_timestamp();
    REQUIRE(ts.size() == 20);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');
}
