#include <catch2/catch_test_macros.hpp>
#include "weather.hpp"
#include "errors.hpp"

using namespace mcp_tools;

TEST_CASE("Current weather", "[weather]") {
    SECTION("Metric is the default label set") {
        auto w = current_weather("London", "uk", UnitSystem::Metric);
        REQUIRE(w["success"] == true);
        REQUIRE(w["location"]["city"] == "London");
        REQUIRE(w["location"]["country"] == "UK");
        REQUIRE(w["location"]["query"] == "London,uk");
        REQUIRE(w["units"]["system"] == "metric");
        REQUIRE(w["units"]["temperature"] == "°C");
        REQUIRE(w["units"]["wind_speed"] == "m/s");
        REQUIRE(w["source"] == "OpenWeatherMap API (Demo Mode)");
    }

    SECTION("Units change labels but not values") {
        auto metric = current_weather("Paris", "", UnitSystem::Metric);
        auto imperial = current_weather("Paris", "", UnitSystem::Imperial);
        auto kelvin = current_weather("Paris", "", UnitSystem::Kelvin);

        REQUIRE(imperial["units"]["system"] == "imperial");
        REQUIRE(kelvin["units"]["system"] == "kelvin");
        REQUIRE(imperial["units"]["temperature"] == "°F");
        REQUIRE(imperial["units"]["wind_speed"] == "mph");
        REQUIRE(kelvin["units"]["temperature"] == "K");

        REQUIRE(metric["current"] == imperial["current"]);
        REQUIRE(metric["current"] == kelvin["current"]);
    }

    SECTION("Missing country code") {
        auto w = current_weather("Tokyo", "", UnitSystem::Metric);
        REQUIRE(w["location"]["country"] == "Unknown");
        REQUIRE(w["location"]["query"] == "Tokyo");
    }

    SECTION("Same input gives the same answer") {
        REQUIRE(current_weather("Oslo", "no", UnitSystem::Kelvin) ==
                current_weather("Oslo", "no", UnitSystem::Kelvin));
    }

    SECTION("Blank city is a tool failure") {
        REQUIRE_THROWS_AS(current_weather("", "", UnitSystem::Metric), ToolError);
        REQUIRE_THROWS_AS(current_weather("   ", "us", UnitSystem::Metric), ToolError);
    }
}

TEST_CASE("Forecast", "[weather]") {
    SECTION("Days are clamped to one through five") {
        REQUIRE(weather_forecast("Rome", "", 0)["forecast"].size() == 1);
        REQUIRE(weather_forecast("Rome", "", -7)["forecast_days"] == 1);
        REQUIRE(weather_forecast("Rome", "", 3)["forecast"].size() == 3);
        REQUIRE(weather_forecast("Rome", "", 99)["forecast"].size() == 5);
        REQUIRE(weather_forecast("Rome", "", 99)["forecast_days"] == 5);
    }

    SECTION("Fixed dates and conditions") {
        auto f = weather_forecast("Rome", "it", 5);
        const auto& days = f["forecast"];
        REQUIRE(days[0]["date"] == "2025-10-28");
        REQUIRE(days[4]["date"] == "2025-11-01");
        REQUIRE(days[0]["condition"]["main"] == "Sunny");
        REQUIRE(days[2]["condition"]["main"] == "Rainy");
        REQUIRE(days[0]["temperature"]["high"] == 22);
        REQUIRE(days[0]["temperature"]["low"] == 17);
        REQUIRE(f["location"]["country"] == "IT");
    }

    SECTION("Blank city is a tool failure") {
        REQUIRE_THROWS_AS(weather_forecast("", "", 3), ToolError);
    }
}

TEST_CASE("Unit system names", "[weather]") {
    REQUIRE(string_to_unit_system("metric") == UnitSystem::Metric);
    REQUIRE(string_to_unit_system("imperial") == UnitSystem::Imperial);
    REQUIRE(string_to_unit_system("kelvin") == UnitSystem::Kelvin);
    REQUIRE(unit_system_to_string(UnitSystem::Imperial) == "imperial");
    REQUIRE_THROWS_AS(string_to_unit_system("rankine"), InvalidParams);
    REQUIRE_THROWS_AS(string_to_unit_system("Metric"), InvalidParams);
}
