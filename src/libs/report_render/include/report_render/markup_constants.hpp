#pragma once

#include <string_view>

namespace report_render {

// Shared Typst output constants (used by the layout renderer and the report assembler).

namespace markup {

constexpr std::string_view indent_unit = "  ";
// Separates consecutive layouts, and the preamble from the first layout.
constexpr std::string_view block_separator = "\n\n";
constexpr std::string_view content_separator = " ";
constexpr std::string_view alignment_separator = " + ";

// Roots of the generated references when fields are emitted as Typst code.
constexpr std::string_view record_root = "record";
constexpr std::string_view variables_root = "data.variables";
constexpr std::string_view missing_value = "-";

} // namespace markup

} // namespace report_render
