#pragma once

#include <report_ir/ir.hpp>
#include <report_render/value_format.hpp>
#include <string>

namespace report_render {

// Typst code that reads the field from a `record` bound at compile time, e.g.
// `#record.customer.name`. Currency, percent and number formats emit a code block
// that rounds the value and prints "-" for none. Percent references expect values
// already scaled to 0-100.
std::string render_field_reference(const report_ir::Field& field, const FormatOptions& options = {});

// Escapes label text and turns `[name]` placeholders into `#data.variables.name`.
std::string render_label_references(const std::string& text);

} // namespace report_render
