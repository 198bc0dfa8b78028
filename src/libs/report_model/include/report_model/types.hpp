#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace report_model {

enum class LayoutKind { Grid, Table, Stack };

enum class FieldFormat { Number, Currency, Percent, Date, DateTime };

enum class LineOrientation { Horizontal, Vertical };

// Authored length. Numbers are points.
using Dimension = std::variant<std::string, std::int64_t, double>;

// One or two alignment components, e.g. {"left", "top"}.
using Alignment = std::vector<std::string>;

using FontWeight = std::variant<std::string, std::int64_t>;

struct AutoTrack {
    bool operator==(const AutoTrack&) const = default;
};

struct FractionTrack {
    double value = 1;
    bool operator==(const FractionTrack&) const = default;
};

// One entry of an explicit track list.
using TrackSize = std::variant<AutoTrack, FractionTrack, std::string, std::int64_t, double>;

// Column/row declaration as authored: unset, `auto`, a count, or a list of sizes.
// A bare double or string is kept so it can be rejected with the offending value.
using TrackDeclaration =
    std::variant<std::monostate, AutoTrack, std::int64_t, double, std::string, std::vector<TrackSize>>;

struct StyleSpec {
    std::optional<Dimension> font_size;
    std::optional<FontWeight> font_weight;
    std::optional<std::string> font_style;
    std::optional<std::string> color;
    std::optional<std::string> font_family;
    std::optional<std::string> text_align;
};

struct LayoutSpec;

struct ElementSpec {
    // Declared kind ("label", "field", "grid", "table", "stack", ...). May be empty.
    std::string type;
    std::optional<std::string> text;
    std::optional<std::vector<std::string>> source;
    std::optional<FieldFormat> format;
    std::optional<int> decimal_places;
    StyleSpec style;
    // Explicit nested style map; its values win over the flat ones above.
    std::optional<StyleSpec> style_map;
    std::shared_ptr<const LayoutSpec> layout;
};

struct CellSpec {
    std::optional<std::int64_t> x;
    std::optional<std::int64_t> y;
    std::int64_t colspan = 1;
    std::int64_t rowspan = 1;
    std::optional<Alignment> align;
    std::optional<Dimension> inset;
    std::optional<std::string> fill;
    std::optional<Dimension> stroke;
    std::optional<bool> breakable;
    std::vector<ElementSpec> elements;
};

using RowItem = std::variant<CellSpec, ElementSpec>;

struct RowSpec {
    std::optional<Dimension> height;
    std::optional<std::string> fill;
    std::optional<Dimension> stroke;
    std::optional<Alignment> align;
    std::optional<Dimension> inset;
    std::vector<RowItem> items;
};

using SectionEntry = std::variant<RowSpec, CellSpec>;

struct HeaderSpec {
    std::optional<bool> repeat;
    std::int64_t level = 1;
    std::vector<SectionEntry> entries;
};

struct FooterSpec {
    std::optional<bool> repeat;
    std::vector<SectionEntry> entries;
};

struct LineSpec {
    LineOrientation orientation = LineOrientation::Horizontal;
    std::int64_t position = 0;
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> end;
    std::optional<Dimension> stroke;
};

struct LayoutSpec {
    LayoutKind kind = LayoutKind::Grid;
    std::string name;
    TrackDeclaration columns;
    TrackDeclaration rows;
    std::optional<Dimension> gutter;
    std::optional<Dimension> column_gutter;
    std::optional<Dimension> row_gutter;
    std::optional<Alignment> align;
    std::optional<Dimension> inset;
    std::optional<std::string> fill;
    std::optional<Dimension> stroke;
    // stack only
    std::optional<std::string> dir;
    std::optional<Dimension> spacing;

    std::vector<RowSpec> row_entities;
    std::vector<CellSpec> cells;
    std::vector<ElementSpec> elements;
    // table only
    std::vector<HeaderSpec> headers;
    std::vector<FooterSpec> footers;
    std::vector<LineSpec> lines;
};

inline const char* to_string(LayoutKind kind) {
    switch (kind) {
        case LayoutKind::Grid: return "grid";
        case LayoutKind::Table: return "table";
        case LayoutKind::Stack: return "stack";
    }
    return "grid";
}

inline std::optional<LayoutKind> layout_kind_from_string(const std::string& s) {
    if (s == "grid") return LayoutKind::Grid;
    if (s == "table") return LayoutKind::Table;
    if (s == "stack") return LayoutKind::Stack;
    return std::nullopt;
}

inline std::optional<FieldFormat> field_format_from_string(const std::string& s) {
    if (s == "number") return FieldFormat::Number;
    if (s == "currency") return FieldFormat::Currency;
    if (s == "percent") return FieldFormat::Percent;
    if (s == "date") return FieldFormat::Date;
    if (s == "datetime") return FieldFormat::DateTime;
    return std::nullopt;
}

} // namespace report_model
