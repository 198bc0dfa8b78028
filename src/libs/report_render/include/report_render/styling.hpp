#pragma once

#include <report_ir/style.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace report_render {

// Maps authored style keywords to Typst values. Unknown keywords are quoted as-is.
struct StyleVocabulary {
    std::map<std::string, std::string> font_weights;
    // Slants mapped to an empty string are omitted from the output.
    std::map<std::string, std::string> font_styles;
};

const StyleVocabulary& default_style_vocabulary();

std::string render_font_weight(const report_ir::FontWeight& weight,
                               const StyleVocabulary& vocabulary = default_style_vocabulary());

// "#1a2b3c" -> rgb("#1a2b3c"); named colours and expressions pass through.
std::string render_color(const std::string& color);

// `#text` arguments in fixed order: size, weight, style, fill, font.
std::vector<std::string> style_parameters(const report_ir::Style& style,
                                          const StyleVocabulary& vocabulary = default_style_vocabulary());

// Wraps rendered content in #text(...)[...], then #align(...)[...] or #par(justify: true)[...]
// when text_align is set. Content is returned unchanged for an absent or empty style.
std::string apply_style(const std::string& content, const std::optional<report_ir::Style>& style,
                        const StyleVocabulary& vocabulary = default_style_vocabulary());

} // namespace report_render
