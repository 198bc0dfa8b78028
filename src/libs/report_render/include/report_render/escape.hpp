#pragma once

#include <string>
#include <string_view>

namespace report_render {

// Backslash-escapes characters that Typst markup would interpret:
// \ # $ @ * _ [ ] { } < >. Single pass, so output is never double-escaped.
std::string escape_markup(std::string_view text);

// Contents of a Typst string literal ("..."): escapes backslash and double quote.
std::string escape_string_literal(std::string_view text);

std::string quote(std::string_view text);

} // namespace report_render
