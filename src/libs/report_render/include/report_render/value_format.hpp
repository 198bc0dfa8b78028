#pragma once

#include <report_model/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace report_render {

struct FormatOptions {
    std::string currency_symbol = "$";
};

namespace format_defaults {

constexpr int number_decimal_places = 0;
constexpr int currency_decimal_places = 2;
constexpr int percent_decimal_places = 1;

} // namespace format_defaults

// Walks nested objects key by key. nullptr when a key is missing or an intermediate
// value is not an object.
const nlohmann::json* lookup_field(const nlohmann::json& data, const std::vector<std::string>& path);

// Plain textual form: strings as-is, numbers in shortest form, booleans as true/false,
// null as "".
std::string raw_value(const nlohmann::json& value);

std::string format_fixed(double value, int decimal_places);

// Absent, null and "" render as "" for every format. Values the format cannot handle
// are rendered raw.
std::string format_value(const nlohmann::json* value,
                         std::optional<report_model::FieldFormat> format,
                         std::optional<int> decimal_places,
                         const FormatOptions& options = {});

std::optional<std::string> format_date(const std::string& iso);
std::optional<std::string> format_datetime(const std::string& iso);

} // namespace report_render
