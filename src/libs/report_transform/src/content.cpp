#include <report_transform/content.hpp>
#include <report_transform/properties.hpp>
#include <report_transform/transformer.hpp>
#include <report_transform/defaults.hpp>
#include <report_log/logger.hpp>
#include <algorithm>
#include <memory>

namespace report_transform {

namespace {

std::string describe_element(const report_model::ElementSpec& element) {
    if (!element.type.empty()) return element.type;
    return "element without text, source or layout";
}

bool is_text_alignment(const std::string& s) {
    if (s == defaults::justify) return true;
    return std::find(defaults::alignment_components.begin(), defaults::alignment_components.end(), s)
        != defaults::alignment_components.end();
}

} // namespace

report_ir::Style lower_style(const report_model::StyleSpec& style) {
    report_ir::Style out;
    out.font_size = normalize_length(style.font_size);
    out.font_weight = style.font_weight;
    out.font_style = style.font_style;
    out.color = style.color;
    out.font_family = style.font_family;
    out.text_align = style.text_align;
    return out;
}

Result<std::optional<report_ir::Style>> resolve_element_style(const report_model::ElementSpec& element) {
    report_ir::Style style = lower_style(element.style);
    if (element.style_map)
        style = report_ir::merge(style, lower_style(*element.style_map));
    if (style.text_align && !is_text_alignment(*style.text_align))
        return invalid_property("text_align", *style.text_align);
    if (style.empty()) return std::optional<report_ir::Style>();
    return std::optional<report_ir::Style>(std::move(style));
}

Result<report_ir::Content> lower_element(const report_model::ElementSpec& element) {
    if (element.text) {
        report_ir::Label label;
        auto style = resolve_element_style(element);
        if (!style) return style.error();
        label.text = *element.text;
        label.style = std::move(style).value();
        return report_ir::Content(std::move(label));
    }

    if (element.source) {
        report_ir::Field field;
        auto style = resolve_element_style(element);
        if (!style) return style.error();
        field.source = *element.source;
        field.format = element.format;
        field.decimal_places = element.decimal_places;
        field.style = std::move(style).value();
        return report_ir::Content(std::move(field));
    }

    if (element.layout) {
        auto nested = transform(*element.layout);
        if (!nested) return nested.error();
        return report_ir::Content(
            report_ir::NestedLayout{ std::make_shared<report_ir::Layout>(std::move(nested).value()) });
    }

    report_log::logger()->debug("Cannot lower element of type '{}'", element.type);
    return unknown_element_type(describe_element(element));
}

} // namespace report_transform
