#pragma once

#include <report_model/types.hpp>
#include <report_transform/errors.hpp>
#include <optional>
#include <string>

namespace report_transform {

// Integral values print without a fractional part: 2.0 -> "2", 1.5 -> "1.5".
std::string format_number(double value);

// Numbers become points ("10pt"); strings ("auto", "2cm", "1pt + red") pass through.
std::string normalize_length(const report_model::Dimension& value);
std::optional<std::string> normalize_length(const std::optional<report_model::Dimension>& value);

// Rejects empty alignments, more than two components and unknown component names.
Result<report_model::Alignment> normalize_alignment(const report_model::Alignment& value);

// Returns false after storing the error in `error`.
bool normalize_alignment(const std::optional<report_model::Alignment>& value,
                         std::optional<report_model::Alignment>& out,
                         LayoutError& error);

} // namespace report_transform
