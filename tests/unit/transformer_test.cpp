#include <report_transform/transformer.hpp>
#include <gtest/gtest.h>
#include <memory>

using namespace report_model;
using report_transform::ErrorKind;
using report_transform::transform;

namespace {

ElementSpec text(const std::string& s) {
    ElementSpec e;
    e.type = "label";
    e.text = s;
    return e;
}

CellSpec cell_with(std::initializer_list<ElementSpec> elements) {
    CellSpec c;
    c.elements.assign(elements.begin(), elements.end());
    return c;
}

const report_ir::Label& label_of(const report_ir::Cell& cell, std::size_t i = 0) {
    return std::get<report_ir::Label>(cell.content.at(i));
}

} // namespace

TEST(LayoutTransformer, EmptyGridHasNoChildrenAndNoDefaults) {
    LayoutSpec spec;
    spec.kind = LayoutKind::Grid;
    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    const auto& layout = r.value();
    EXPECT_EQ(layout.kind, LayoutKind::Grid);
    EXPECT_TRUE(layout.children.empty());
    EXPECT_TRUE(layout.properties.columns.empty());
    EXPECT_FALSE(layout.properties.stroke.has_value());
    EXPECT_FALSE(layout.properties.inset.has_value());
}

TEST(LayoutTransformer, TableGetsStrokeAndInsetDefaults) {
    LayoutSpec spec;
    spec.kind = LayoutKind::Table;
    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().properties.stroke, "1pt");
    EXPECT_EQ(r.value().properties.inset, "5pt");
}

TEST(LayoutTransformer, AuthoredTableStrokeWins) {
    LayoutSpec spec;
    spec.kind = LayoutKind::Table;
    spec.stroke = std::string("none");
    spec.inset = std::int64_t{ 3 };
    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().properties.stroke, "none");
    EXPECT_EQ(r.value().properties.inset, "3pt");
}

TEST(LayoutTransformer, AxisGutterSuppressesSharedGutter) {
    LayoutSpec spec;
    spec.gutter = std::int64_t{ 10 };
    spec.column_gutter = std::int64_t{ 5 };
    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.value().properties.gutter.has_value());
    EXPECT_EQ(r.value().properties.column_gutter, "5pt");

    LayoutSpec shared;
    shared.gutter = std::string("1em");
    auto s = transform(shared);
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(s.value().properties.gutter, "1em");
}

TEST(LayoutTransformer, ChildrenOrderRowsThenCellsThenElements) {
    LayoutSpec spec;
    spec.columns = std::int64_t{ 2 };
    spec.elements = { text("element") };
    spec.cells = { cell_with({ text("cell") }) };
    RowSpec row;
    row.items = { text("row-a"), text("row-b") };
    spec.row_entities = { row };

    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    const auto& children = r.value().children;
    ASSERT_EQ(children.size(), 3u);
    ASSERT_TRUE(std::holds_alternative<report_ir::Row>(children[0]));
    const auto& lowered_row = std::get<report_ir::Row>(children[0]);
    EXPECT_EQ(lowered_row.index, 0u);
    ASSERT_EQ(lowered_row.cells.size(), 2u);
    EXPECT_EQ(label_of(lowered_row.cells[1]).text, "row-b");
    EXPECT_EQ(label_of(std::get<report_ir::Cell>(children[1])).text, "cell");
    EXPECT_EQ(label_of(std::get<report_ir::Cell>(children[2])).text, "element");
}

TEST(LayoutTransformer, RowIndicesFollowDeclarationOrder) {
    LayoutSpec spec;
    for (int i = 0; i < 3; ++i) {
        RowSpec row;
        row.items = { text("r" + std::to_string(i)) };
        spec.row_entities.push_back(row);
    }
    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    for (std::size_t i = 0; i < 3; ++i) {
        const auto& row = std::get<report_ir::Row>(r.value().children[i]);
        EXPECT_EQ(row.index, i);
        EXPECT_EQ(row.cells[0].position.row, static_cast<std::int64_t>(i));
    }
}

TEST(LayoutTransformer, CellsInRowAdvanceColumnBySpan) {
    LayoutSpec spec;
    RowSpec row;
    CellSpec wide = cell_with({ text("wide") });
    wide.colspan = 2;
    row.items = { wide, text("next") };
    spec.row_entities = { row };

    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    const auto& cells = std::get<report_ir::Row>(r.value().children[0]).cells;
    EXPECT_EQ(cells[0].position.column, 0);
    EXPECT_EQ(cells[0].span.colspan, 2);
    EXPECT_EQ(cells[1].position.column, 2);
}

TEST(LayoutTransformer, LooseCellDefaults) {
    LayoutSpec spec;
    spec.cells = { cell_with({ text("a") }) };
    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    const auto& cell = std::get<report_ir::Cell>(r.value().children[0]);
    EXPECT_EQ(cell.position, (report_ir::Position{ 0, 0 }));
    EXPECT_EQ(cell.span, (report_ir::Span{ 1, 1 }));
    EXPECT_EQ(cell.properties, report_ir::CellProperties{});
}

TEST(LayoutTransformer, ExplicitCellPositionAndProperties) {
    LayoutSpec spec;
    CellSpec c = cell_with({ text("a") });
    c.x = 2;
    c.y = 1;
    c.align = Alignment{ "center", "horizon" };
    c.fill = std::string("#eeeeee");
    c.breakable = false;
    spec.cells = { c };
    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    const auto& cell = std::get<report_ir::Cell>(r.value().children[0]);
    EXPECT_EQ(cell.position, (report_ir::Position{ 2, 1 }));
    EXPECT_EQ(cell.properties.align, (Alignment{ "center", "horizon" }));
    EXPECT_EQ(cell.properties.fill, "#eeeeee");
    EXPECT_EQ(cell.properties.breakable, false);
}

TEST(LayoutTransformer, TableHeadersAndFooters) {
    LayoutSpec spec;
    spec.kind = LayoutKind::Table;

    HeaderSpec header;
    RowSpec header_row;
    header_row.items = { text("Name"), text("Amount") };
    header.entries = { header_row };
    spec.headers = { header };

    FooterSpec footer;
    footer.entries = { cell_with({ text("Total") }) };
    spec.footers = { footer };

    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    const auto& layout = r.value();
    ASSERT_EQ(layout.headers.size(), 1u);
    EXPECT_TRUE(layout.headers[0].repeat);
    EXPECT_EQ(layout.headers[0].level, 1);
    ASSERT_EQ(layout.headers[0].rows.size(), 1u);
    EXPECT_EQ(layout.headers[0].rows[0].cells.size(), 2u);

    ASSERT_EQ(layout.footers.size(), 1u);
    EXPECT_FALSE(layout.footers[0].repeat);
    ASSERT_EQ(layout.footers[0].rows.size(), 1u);
    EXPECT_EQ(layout.footers[0].rows[0].index, 0u);
    EXPECT_EQ(label_of(layout.footers[0].rows[0].cells[0]).text, "Total");
}

TEST(LayoutTransformer, HeaderRepeatCanBeDisabled) {
    LayoutSpec spec;
    spec.kind = LayoutKind::Table;
    HeaderSpec header;
    header.repeat = false;
    header.level = 2;
    spec.headers = { header };
    FooterSpec footer;
    footer.repeat = true;
    spec.footers = { footer };

    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.value().headers[0].repeat);
    EXPECT_EQ(r.value().headers[0].level, 2);
    EXPECT_TRUE(r.value().footers[0].repeat);
}

TEST(LayoutTransformer, GridIgnoresHeaders) {
    LayoutSpec spec;
    spec.headers = { HeaderSpec{} };
    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().headers.empty());
}

TEST(LayoutTransformer, StackWrapsEachElement) {
    LayoutSpec spec;
    spec.kind = LayoutKind::Stack;
    spec.dir = "ltr";
    spec.spacing = std::int64_t{ 10 };
    spec.elements = { text("a"), text("b") };
    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    const auto& layout = r.value();
    EXPECT_EQ(layout.properties.dir, "ltr");
    EXPECT_EQ(layout.properties.spacing, "10pt");
    ASSERT_EQ(layout.children.size(), 2u);
    for (const auto& child : layout.children) {
        const auto& cell = std::get<report_ir::Cell>(child);
        EXPECT_EQ(cell.content.size(), 1u);
    }
}

TEST(LayoutTransformer, StackRejectsUnknownDirection) {
    LayoutSpec spec;
    spec.kind = LayoutKind::Stack;
    spec.dir = "diagonal";
    auto r = transform(spec);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidProperty);
    EXPECT_EQ(r.error().subject, "dir");
}

TEST(LayoutTransformer, InvalidAlignmentIsRejected) {
    LayoutSpec spec;
    spec.align = Alignment{ "middle" };
    auto r = transform(spec);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidProperty);
    EXPECT_EQ(r.error().value, "middle");
}

TEST(LayoutTransformer, ZeroColspanIsRejected) {
    LayoutSpec spec;
    CellSpec c = cell_with({ text("a") });
    c.colspan = 0;
    spec.cells = { c };
    auto r = transform(spec);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().subject, "colspan");
}

TEST(LayoutTransformer, FirstErrorAbortsTransform) {
    LayoutSpec spec;
    ElementSpec image;
    image.type = "image";
    ElementSpec chart;
    chart.type = "chart";
    spec.elements = { text("ok"), image, chart };
    auto r = transform(spec);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::UnknownElementType);
    EXPECT_EQ(r.error().subject, "image");
}

TEST(LayoutTransformer, TrackErrorNamesAxis) {
    LayoutSpec spec;
    spec.rows = std::int64_t{ -1 };
    auto r = transform(spec);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidTrackDefinition);
    EXPECT_EQ(r.error().subject, "rows");
}

TEST(LayoutTransformer, ErrorInsideNestedCellPropagates) {
    auto inner = std::make_shared<LayoutSpec>();
    inner->kind = LayoutKind::Table;
    ElementSpec unknown;
    unknown.type = "barcode";
    inner->elements = { unknown };

    ElementSpec nested;
    nested.type = "table";
    nested.layout = inner;

    LayoutSpec outer;
    outer.kind = LayoutKind::Stack;
    outer.elements = { nested };

    auto r = transform(outer);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().subject, "barcode");
}

TEST(LayoutTransformer, LinesAreKept) {
    LayoutSpec spec;
    LineSpec line;
    line.orientation = LineOrientation::Vertical;
    line.position = 1;
    line.stroke = std::int64_t{ 2 };
    spec.lines = { line };
    auto r = transform(spec);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value().lines.size(), 1u);
    EXPECT_EQ(r.value().lines[0].orientation, LineOrientation::Vertical);
    EXPECT_EQ(r.value().lines[0].stroke, "2pt");
}

TEST(LayoutTransformer, TransformIsDeterministic) {
    auto inner = std::make_shared<LayoutSpec>();
    inner->kind = LayoutKind::Grid;
    inner->columns = std::int64_t{ 2 };
    inner->elements = { text("x"), text("y") };
    ElementSpec nested;
    nested.type = "grid";
    nested.layout = inner;

    LayoutSpec spec;
    spec.kind = LayoutKind::Table;
    spec.columns = std::vector<TrackSize>{ FractionTrack{ 1 }, AutoTrack{} };
    spec.elements = { text("a"), nested };

    auto first = transform(spec);
    auto second = transform(spec);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.value(), second.value());
    // Nested subtrees are distinct objects that compare equal by value.
    const auto& a = std::get<report_ir::NestedLayout>(std::get<report_ir::Cell>(first.value().children[1]).content[0]);
    const auto& b = std::get<report_ir::NestedLayout>(std::get<report_ir::Cell>(second.value().children[1]).content[0]);
    EXPECT_NE(a.layout.get(), b.layout.get());
    EXPECT_TRUE(a == b);
}

TEST(LayoutTransformer, ReportTransformsEveryLayout) {
    ReportSpec report;
    report.layouts.resize(2);
    report.layouts[1].kind = LayoutKind::Table;
    auto r = report_transform::transform_report(report);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_EQ(r.value()[1].kind, LayoutKind::Table);

    report.layouts[1].columns = std::int64_t{ 0 };
    EXPECT_FALSE(report_transform::transform_report(report).ok());
}
