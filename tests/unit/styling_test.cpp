#include <report_render/styling.hpp>
#include <gtest/gtest.h>

using report_ir::Style;
using report_render::apply_style;
using report_render::render_color;
using report_render::render_font_weight;
using report_render::style_parameters;

TEST(StyleResolver, EmptyStyleLeavesContentAlone) {
    EXPECT_EQ(apply_style("Total", std::nullopt), "Total");
    EXPECT_EQ(apply_style("Total", Style{}), "Total");
}

TEST(StyleResolver, ParametersInCanonicalOrder) {
    Style style;
    style.font_family = "Arial";
    style.color = "red";
    style.font_style = "italic";
    style.font_weight = std::string("bold");
    style.font_size = "14pt";
    EXPECT_EQ(apply_style("x", style),
              "#text(size: 14pt, weight: \"bold\", style: \"italic\", fill: red, font: \"Arial\")[x]");
}

TEST(StyleResolver, FontWeights) {
    EXPECT_EQ(render_font_weight(std::string("normal")), "\"regular\"");
    EXPECT_EQ(render_font_weight(std::string("bold")), "\"bold\"");
    EXPECT_EQ(render_font_weight(std::string("semibold")), "\"semibold\"");
    EXPECT_EQ(render_font_weight(std::string("extralight")), "\"extralight\"");
    EXPECT_EQ(render_font_weight(std::int64_t{ 700 }), "700");
    EXPECT_EQ(render_font_weight(std::string("heavy")), "\"heavy\"");
}

TEST(StyleResolver, NormalSlantIsOmitted) {
    Style style;
    style.font_style = "normal";
    EXPECT_TRUE(style_parameters(style).empty());
    EXPECT_EQ(apply_style("x", style), "x");
}

TEST(StyleResolver, HexColorsUseRgb) {
    EXPECT_EQ(render_color("#ff0000"), "rgb(\"#ff0000\")");
    EXPECT_EQ(render_color("blue"), "blue");
    EXPECT_EQ(render_color("rgb(10, 20, 30)"), "rgb(10, 20, 30)");
}

TEST(StyleResolver, FontFamilyQuotesAreEscaped) {
    Style style;
    style.font_family = "My \"Special\" Font";
    EXPECT_EQ(apply_style("x", style), "#text(font: \"My \\\"Special\\\" Font\")[x]");
}

TEST(StyleResolver, AlignmentWrapsText) {
    Style style;
    style.font_weight = std::string("bold");
    style.text_align = "center";
    EXPECT_EQ(apply_style("x", style), "#align(center)[#text(weight: \"bold\")[x]]");

    Style align_only;
    align_only.text_align = "right";
    EXPECT_EQ(apply_style("x", align_only), "#align(right)[x]");
}

TEST(StyleResolver, JustifyUsesParagraph) {
    Style style;
    style.text_align = "justify";
    EXPECT_EQ(apply_style("long text", style), "#par(justify: true)[long text]");
}

TEST(StyleResolver, CustomVocabulary) {
    report_render::StyleVocabulary vocabulary;
    vocabulary.font_weights = { { "strong", "800" } };
    Style style;
    style.font_weight = std::string("strong");
    EXPECT_EQ(apply_style("x", style, vocabulary), "#text(weight: 800)[x]");
}
