#pragma once

#include <report_ir/style.hpp>
#include <report_model/types.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace report_ir {

using report_model::Alignment;
using report_model::FieldFormat;
using report_model::LayoutKind;
using report_model::LineOrientation;

struct Layout;

struct Label {
    std::string text;
    std::optional<Style> style;
    bool operator==(const Label&) const = default;
};

struct Field {
    // Key path into the data context; a single key is a one-element path.
    std::vector<std::string> source;
    std::optional<FieldFormat> format;
    std::optional<int> decimal_places;
    std::optional<Style> style;
    bool operator==(const Field&) const = default;
};

// Shares an immutable subtree. Compared by value, not by pointer.
struct NestedLayout {
    std::shared_ptr<const Layout> layout;
};

bool operator==(const NestedLayout& a, const NestedLayout& b);

using Content = std::variant<Label, Field, NestedLayout>;

struct Position {
    std::int64_t column = 0;
    std::int64_t row = 0;
    bool operator==(const Position&) const = default;
};

struct Span {
    std::int64_t colspan = 1;
    std::int64_t rowspan = 1;
    bool operator==(const Span&) const = default;
};

struct CellProperties {
    std::optional<Alignment> align;
    std::optional<std::string> inset;
    std::optional<std::string> fill;
    std::optional<std::string> stroke;
    std::optional<bool> breakable;
    bool operator==(const CellProperties&) const = default;
};

struct Cell {
    Position position;
    Span span;
    CellProperties properties;
    std::vector<Content> content;
    bool operator==(const Cell&) const = default;
};

struct RowProperties {
    std::optional<std::string> height;
    std::optional<std::string> fill;
    std::optional<std::string> stroke;
    std::optional<Alignment> align;
    std::optional<std::string> inset;
    bool operator==(const RowProperties&) const = default;
};

struct Row {
    std::size_t index = 0;
    RowProperties properties;
    std::vector<Cell> cells;
    bool operator==(const Row&) const = default;
};

using Child = std::variant<Row, Cell>;

struct Header {
    bool repeat = true;
    std::int64_t level = 1;
    std::vector<Row> rows;
    bool operator==(const Header&) const = default;
};

struct Footer {
    bool repeat = false;
    std::vector<Row> rows;
    bool operator==(const Footer&) const = default;
};

// Separator drawn across the layout; `position` is a row (horizontal) or column (vertical) boundary.
struct Line {
    LineOrientation orientation = LineOrientation::Horizontal;
    std::int64_t position = 0;
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> end;
    std::optional<std::string> stroke;
    bool operator==(const Line&) const = default;
};

struct LayoutProperties {
    std::vector<std::string> columns;
    std::vector<std::string> rows;
    std::optional<std::string> gutter;
    std::optional<std::string> column_gutter;
    std::optional<std::string> row_gutter;
    std::optional<Alignment> align;
    std::optional<std::string> inset;
    std::optional<std::string> fill;
    std::optional<std::string> stroke;
    std::optional<std::string> dir;
    std::optional<std::string> spacing;
    bool operator==(const LayoutProperties&) const = default;
};

struct Layout {
    LayoutKind kind = LayoutKind::Grid;
    LayoutProperties properties;
    std::vector<Child> children;
    std::vector<Header> headers;
    std::vector<Footer> footers;
    std::vector<Line> lines;
    bool operator==(const Layout&) const = default;
};

} // namespace report_ir
