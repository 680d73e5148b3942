#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace mcp_tools {

enum class UnitSystem {
    Metric,
    Imperial,
    Kelvin
};

// Throws InvalidParams for anything other than metric, imperial or kelvin
UnitSystem string_to_unit_system(const std::string& s);
std::string unit_system_to_string(UnitSystem u);

// Demo-mode weather. Both functions are pure: static placeholder values,
// no network or filesystem access. Units only change the labels.
nlohmann::json current_weather(const std::string& city, const std::string& country_code, UnitSystem units);

// `days` is clamped to [1, 5]
nlohmann::json weather_forecast(const std::string& city, const std::string& country_code, int days);

} // namespace mcp_tools
