#include <report_transform/content.hpp>
#include <gtest/gtest.h>
#include <memory>

using namespace report_model;
using report_transform::lower_element;
using report_transform::resolve_element_style;

namespace {

ElementSpec text_element(const std::string& text) {
    ElementSpec e;
    e.type = "label";
    e.text = text;
    return e;
}

ElementSpec field_element(std::vector<std::string> source) {
    ElementSpec e;
    e.type = "field";
    e.source = std::move(source);
    return e;
}

} // namespace

TEST(ContentLowering, TextBecomesLabel) {
    auto r = lower_element(text_element("Total"));
    ASSERT_TRUE(r.ok());
    const auto* label = std::get_if<report_ir::Label>(&r.value());
    ASSERT_NE(label, nullptr);
    EXPECT_EQ(label->text, "Total");
    EXPECT_FALSE(label->style.has_value());
}

TEST(ContentLowering, SourceBecomesFieldWithFormat) {
    ElementSpec e = field_element({ "invoice", "amount" });
    e.format = FieldFormat::Currency;
    e.decimal_places = 3;
    auto r = lower_element(e);
    ASSERT_TRUE(r.ok());
    const auto* field = std::get_if<report_ir::Field>(&r.value());
    ASSERT_NE(field, nullptr);
    EXPECT_EQ(field->source, (std::vector<std::string>{ "invoice", "amount" }));
    EXPECT_EQ(field->format, FieldFormat::Currency);
    EXPECT_EQ(field->decimal_places, 3);
}

TEST(ContentLowering, TextWinsOverSource) {
    ElementSpec e = text_element("Label");
    e.source = std::vector<std::string>{ "x" };
    auto r = lower_element(e);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(std::holds_alternative<report_ir::Label>(r.value()));
}

TEST(ContentLowering, LayoutBecomesNestedLayout) {
    auto inner = std::make_shared<LayoutSpec>();
    inner->kind = LayoutKind::Grid;
    inner->columns = std::int64_t{ 2 };
    inner->elements = { text_element("A"), text_element("B") };

    ElementSpec e;
    e.type = "grid";
    e.layout = inner;

    auto r = lower_element(e);
    ASSERT_TRUE(r.ok());
    const auto* nested = std::get_if<report_ir::NestedLayout>(&r.value());
    ASSERT_NE(nested, nullptr);
    ASSERT_TRUE(nested->layout);
    EXPECT_EQ(nested->layout->kind, LayoutKind::Grid);
    EXPECT_EQ(nested->layout->properties.columns, (std::vector<std::string>{ "auto", "auto" }));
    EXPECT_EQ(nested->layout->children.size(), 2u);
}

TEST(ContentLowering, NestedErrorPropagates) {
    auto inner = std::make_shared<LayoutSpec>();
    inner->columns = std::int64_t{ 0 };
    ElementSpec e;
    e.type = "grid";
    e.layout = inner;

    auto r = lower_element(e);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, report_transform::ErrorKind::InvalidTrackDefinition);
}

TEST(ContentLowering, UnknownElementIsRejected) {
    ElementSpec e;
    e.type = "image";
    auto r = lower_element(e);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, report_transform::ErrorKind::UnknownElementType);
    EXPECT_EQ(r.error().subject, "image");
    EXPECT_EQ(r.error().message(), "Unknown element type: image");
}

TEST(ContentLowering, StyleAbsentWhenNothingSet) {
    auto plain = resolve_element_style(text_element("x"));
    ASSERT_TRUE(plain.ok());
    EXPECT_FALSE(plain.value().has_value());

    ElementSpec e = text_element("x");
    e.style_map = StyleSpec{};
    auto empty_map = resolve_element_style(e);
    ASSERT_TRUE(empty_map.ok());
    EXPECT_FALSE(empty_map.value().has_value());
}

TEST(ContentLowering, StyleMapWinsOverFlatAttributes) {
    ElementSpec e = text_element("x");
    e.style.font_weight = std::string("light");
    e.style.color = std::string("red");
    StyleSpec map;
    map.font_weight = std::string("bold");
    map.font_size = std::int64_t{ 12 };
    e.style_map = map;

    auto resolved = resolve_element_style(e);
    ASSERT_TRUE(resolved.ok());
    const auto& style = resolved.value();
    ASSERT_TRUE(style.has_value());
    EXPECT_EQ(style->font_weight, FontWeight(std::string("bold")));
    EXPECT_EQ(style->color, "red");
    EXPECT_EQ(style->font_size, "12pt");
}

TEST(ContentLowering, StyleIsCarriedOnField) {
    ElementSpec e = field_element({ "name" });
    e.style.font_style = std::string("italic");
    auto r = lower_element(e);
    ASSERT_TRUE(r.ok());
    const auto& field = std::get<report_ir::Field>(r.value());
    ASSERT_TRUE(field.style.has_value());
    EXPECT_EQ(field.style->font_style, "italic");
}

TEST(ContentLowering, TextAlignAcceptsComponentsAndJustify) {
    for (const char* align : { "left", "center", "right", "justify" }) {
        ElementSpec e = text_element("x");
        e.style.text_align = std::string(align);
        auto r = lower_element(e);
        ASSERT_TRUE(r.ok()) << align;
        EXPECT_EQ(std::get<report_ir::Label>(r.value()).style->text_align, align);
    }
}

TEST(ContentLowering, UnknownTextAlignIsRejected) {
    ElementSpec label = text_element("x");
    label.style.text_align = std::string("center)[#evil(");
    auto r = lower_element(label);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, report_transform::ErrorKind::InvalidProperty);
    EXPECT_EQ(r.error().subject, "text_align");

    ElementSpec field = field_element({ "name" });
    StyleSpec map;
    map.text_align = std::string("middle");
    field.style_map = map;
    auto f = lower_element(field);
    ASSERT_FALSE(f.ok());
    EXPECT_EQ(f.error().value, "middle");
}
