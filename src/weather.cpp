#include "weather.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace mcp_tools {

namespace {

constexpr const char* kSource = "OpenWeatherMap API (Demo Mode)";
constexpr const char* kObservedAt = "2025-10-27T22:55:00Z";
constexpr int kMaxForecastDays = 5;

const std::array<const char*, kMaxForecastDays> kForecastDates = {
    "2025-10-28", "2025-10-29", "2025-10-30", "2025-10-31", "2025-11-01"
};
const std::array<const char*, kMaxForecastDays> kConditions = {
    "Sunny", "Cloudy", "Rainy", "Partly Cloudy", "Clear"
};
const std::array<const char*, kMaxForecastDays> kDescriptions = {
    "clear sky", "few clouds", "light rain", "partly cloudy", "clear sky"
};
const std::array<int, kMaxForecastDays> kPrecipChance = {10, 30, 80, 20, 5};
const std::array<double, kMaxForecastDays> kPrecipAmount = {0.0, 0.2, 5.4, 1.1, 0.0};

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

nlohmann::json location_json(const std::string& city, const std::string& country_code) {
    return {
        {"city", city},
        {"country", country_code.empty() ? std::string("Unknown") : upper(country_code)},
        {"query", country_code.empty() ? city : city + "," + country_code}
    };
}

nlohmann::json unit_labels(UnitSystem units) {
    nlohmann::json labels = {{"system", unit_system_to_string(units)}};
    switch (units) {
        case UnitSystem::Imperial:
            labels["temperature"] = "°F";
            labels["wind_speed"] = "mph";
            break;
        case UnitSystem::Kelvin:
            labels["temperature"] = "K";
            labels["wind_speed"] = "m/s";
            break;
        case UnitSystem::Metric:
        default:
            labels["temperature"] = "°C";
            labels["wind_speed"] = "m/s";
            break;
    }
    return labels;
}

void require_city(const std::string& city) {
    if (city.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ToolError("city parameter is required and cannot be empty");
    }
}

} // namespace

UnitSystem string_to_unit_system(const std::string& s) {
    if (s == "metric") return UnitSystem::Metric;
    if (s == "imperial") return UnitSystem::Imperial;
    if (s == "kelvin") return UnitSystem::Kelvin;
    throw InvalidParams("units must be one of: metric, imperial, kelvin");
}

std::string unit_system_to_string(UnitSystem u) {
    switch (u) {
        case UnitSystem::Imperial: return "imperial";
        case UnitSystem::Kelvin: return "kelvin";
        case UnitSystem::Metric:
        default: return "metric";
    }
}

nlohmann::json current_weather(const std::string& city, const std::string& country_code, UnitSystem units) {
    require_city(city);

    return {
        {"location", location_json(city, country_code)},
        {"current", {
            {"temperature", 22.5},
            {"feels_like", 21.8},
            {"temp_min", 19.0},
            {"temp_max", 25.0},
            {"humidity", 65},
            {"pressure", 1013},
            {"visibility", 10000}
        }},
        {"condition", {
            {"main", "Partly Cloudy"},
            {"description", "partly cloudy"},
            {"icon", "02d"}
        }},
        {"wind", {{"speed", 3.5}, {"direction", 180}}},
        {"clouds", {{"coverage", 40}}},
        {"units", unit_labels(units)},
        {"timestamp", kObservedAt},
        {"source", kSource},
        {"success", true}
    };
}

nlohmann::json weather_forecast(const std::string& city, const std::string& country_code, int days) {
    require_city(city);
    days = std::clamp(days, 1, kMaxForecastDays);

    const int base_temp = 20;
    nlohmann::json forecast = nlohmann::json::array();
    for (int i = 0; i < days; i++) {
        forecast.push_back({
            {"date", kForecastDates[i]},
            {"temperature", {{"high", base_temp + i + 2}, {"low", base_temp + i - 3}}},
            {"condition", {{"main", kConditions[i]}, {"description", kDescriptions[i]}}},
            {"precipitation", {{"chance", kPrecipChance[i]}, {"amount", kPrecipAmount[i]}}},
            {"wind", {{"speed", 3.0 + i * 0.5}, {"direction", 180 + i * 30}}}
        });
    }

    return {
        {"location", location_json(city, country_code)},
        {"forecast", forecast},
        {"forecast_days", days},
        {"timestamp", kObservedAt},
        {"source", kSource},
        {"success", true}
    };
}

} // namespace mcp_tools
