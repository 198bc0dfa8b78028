#include <report_ir/ir.hpp>

namespace report_ir {

namespace {

template <typename T>
void take(std::optional<T>& into, const std::optional<T>& from) {
    if (from) into = from;
}

} // namespace

bool Style::empty() const {
    return !font_size && !font_weight && !font_style && !color && !font_family && !text_align;
}

Style merge(const Style& base, const Style& override) {
    Style out = base;
    take(out.font_size, override.font_size);
    take(out.font_weight, override.font_weight);
    take(out.font_style, override.font_style);
    take(out.color, override.color);
    take(out.font_family, override.font_family);
    take(out.text_align, override.text_align);
    return out;
}

bool operator==(const NestedLayout& a, const NestedLayout& b) {
    if (a.layout == b.layout) return true;
    if (!a.layout || !b.layout) return false;
    return *a.layout == *b.layout;
}

} // namespace report_ir
