#pragma once

#include <report_model/types.hpp>
#include <optional>
#include <string>

namespace report_ir {

using report_model::FontWeight;

// Text style attached to a label or field. Absent fields are not emitted.
struct Style {
    std::optional<std::string> font_size;
    std::optional<FontWeight> font_weight;
    std::optional<std::string> font_style;
    std::optional<std::string> color;
    std::optional<std::string> font_family;
    std::optional<std::string> text_align;

    bool empty() const;
    bool operator==(const Style&) const = default;
};

// Fields set in `override` replace those in `base`.
Style merge(const Style& base, const Style& override);

} // namespace report_ir
