#include <report_render/styling.hpp>
#include <report_render/escape.hpp>

namespace report_render {

namespace {

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += separator;
        out += part;
    }
    return out;
}

std::optional<std::string> render_font_style(const std::string& slant, const StyleVocabulary& vocabulary) {
    auto it = vocabulary.font_styles.find(slant);
    if (it == vocabulary.font_styles.end()) return quote(slant);
    if (it->second.empty()) return std::nullopt;
    return it->second;
}

} // namespace

const StyleVocabulary& default_style_vocabulary() {
    static const StyleVocabulary vocabulary{
        {
            { "normal", "\"regular\"" },
            { "regular", "\"regular\"" },
            { "bold", "\"bold\"" },
            { "light", "\"light\"" },
            { "medium", "\"medium\"" },
            { "semibold", "\"semibold\"" },
            { "thin", "\"thin\"" },
            { "black", "\"black\"" },
            { "extrabold", "\"extrabold\"" },
            { "extralight", "\"extralight\"" },
        },
        {
            { "normal", "" },
            { "italic", "\"italic\"" },
            { "oblique", "\"oblique\"" },
        },
    };
    return vocabulary;
}

std::string render_font_weight(const report_ir::FontWeight& weight, const StyleVocabulary& vocabulary) {
    if (const auto* numeric = std::get_if<std::int64_t>(&weight)) return std::to_string(*numeric);
    const auto& name = std::get<std::string>(weight);
    auto it = vocabulary.font_weights.find(name);
    if (it != vocabulary.font_weights.end()) return it->second;
    return quote(name);
}

std::string render_color(const std::string& color) {
    if (!color.empty() && color.front() == '#') return "rgb(" + quote(color) + ")";
    return color;
}

std::vector<std::string> style_parameters(const report_ir::Style& style, const StyleVocabulary& vocabulary) {
    std::vector<std::string> params;
    if (style.font_size) params.push_back("size: " + *style.font_size);
    if (style.font_weight) params.push_back("weight: " + render_font_weight(*style.font_weight, vocabulary));
    if (style.font_style) {
        if (auto slant = render_font_style(*style.font_style, vocabulary)) params.push_back("style: " + *slant);
    }
    if (style.color) params.push_back("fill: " + render_color(*style.color));
    if (style.font_family) params.push_back("font: " + quote(*style.font_family));
    return params;
}

std::string apply_style(const std::string& content, const std::optional<report_ir::Style>& style,
                        const StyleVocabulary& vocabulary) {
    if (!style || style->empty()) return content;

    std::string out = content;
    const auto params = style_parameters(*style, vocabulary);
    if (!params.empty()) out = "#text(" + join(params, ", ") + ")[" + out + "]";

    if (style->text_align) {
        if (*style->text_align == "justify")
            out = "#par(justify: true)[" + out + "]";
        else
            out = "#align(" + *style->text_align + ")[" + out + "]";
    }
    return out;
}

} // namespace report_render
