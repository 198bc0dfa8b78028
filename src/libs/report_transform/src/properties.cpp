#include <report_transform/properties.hpp>
#include <report_transform/defaults.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace report_transform {

namespace {

bool is_alignment_component(const std::string& s) {
    return std::find(defaults::alignment_components.begin(), defaults::alignment_components.end(), s)
        != defaults::alignment_components.end();
}

std::string join_alignment(const report_model::Alignment& value) {
    std::string out;
    for (const auto& part : value) {
        if (!out.empty()) out += " + ";
        out += part;
    }
    return out;
}

} // namespace

std::string format_number(double value) {
    if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 1e15)
        return std::to_string(static_cast<long long>(value));
    return fmt::format("{}", value);
}

std::string normalize_length(const report_model::Dimension& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* i = std::get_if<std::int64_t>(&value))
        return std::to_string(*i) + std::string(defaults::point_unit);
    return format_number(std::get<double>(value)) + std::string(defaults::point_unit);
}

std::optional<std::string> normalize_length(const std::optional<report_model::Dimension>& value) {
    if (!value) return std::nullopt;
    return normalize_length(*value);
}

Result<report_model::Alignment> normalize_alignment(const report_model::Alignment& value) {
    if (value.empty() || value.size() > defaults::max_alignment_components)
        return invalid_property("align", join_alignment(value));
    for (const auto& part : value) {
        if (!is_alignment_component(part))
            return invalid_property("align", join_alignment(value));
    }
    return value;
}

bool normalize_alignment(const std::optional<report_model::Alignment>& value,
                         std::optional<report_model::Alignment>& out,
                         LayoutError& error) {
    if (!value) return true;
    auto normalized = normalize_alignment(*value);
    if (!normalized) {
        error = normalized.error();
        return false;
    }
    out = std::move(normalized).value();
    return true;
}

} // namespace report_transform
