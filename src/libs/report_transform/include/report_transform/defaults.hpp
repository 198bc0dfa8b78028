#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace report_transform {

// Defaults and vocabularies applied while lowering authored layouts.

namespace defaults {

constexpr std::string_view table_stroke = "1pt";
constexpr std::string_view table_inset = "5pt";
constexpr std::string_view auto_track = "auto";
constexpr std::string_view point_unit = "pt";
constexpr std::string_view fraction_unit = "fr";
// Largest track count accepted from a bare integer declaration.
constexpr std::int64_t max_track_count = 1000;

constexpr std::array<std::string_view, 8> alignment_components = {
    "left", "center", "right", "start", "end", "top", "horizon", "bottom",
};
// An alignment combines at most one horizontal and one vertical component.
constexpr std::size_t max_alignment_components = 2;
// Text alignment accepts one component or this keyword.
constexpr std::string_view justify = "justify";

constexpr std::array<std::string_view, 4> stack_directions = { "ttb", "btt", "ltr", "rtl" };

} // namespace defaults

} // namespace report_transform
