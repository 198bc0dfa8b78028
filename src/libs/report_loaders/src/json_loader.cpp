#include <report_loaders/json_loader.hpp>
#include <report_log/logger.hpp>
#include <fstream>
#include <memory>

namespace report_loaders {

namespace {

using nlohmann::json;

bool fail(const std::string& what) {
    report_log::logger()->warn("Invalid report JSON: {}", what);
    return false;
}

bool has(const json& j, const char* key) {
    return j.contains(key) && !j[key].is_null();
}

bool read_string(const json& j, const char* key, std::optional<std::string>& out) {
    if (!has(j, key)) return true;
    if (!j[key].is_string()) return fail(std::string("'") + key + "' must be a string");
    out = j[key].get<std::string>();
    return true;
}

bool read_int(const json& j, const char* key, std::optional<std::int64_t>& out) {
    if (!has(j, key)) return true;
    if (!j[key].is_number_integer()) return fail(std::string("'") + key + "' must be an integer");
    out = j[key].get<std::int64_t>();
    return true;
}

bool read_bool(const json& j, const char* key, std::optional<bool>& out) {
    if (!has(j, key)) return true;
    if (!j[key].is_boolean()) return fail(std::string("'") + key + "' must be a boolean");
    out = j[key].get<bool>();
    return true;
}

bool read_dimension(const json& j, const char* key, std::optional<report_model::Dimension>& out) {
    if (!has(j, key)) return true;
    const json& v = j[key];
    if (v.is_string()) out = v.get<std::string>();
    else if (v.is_number_integer()) out = v.get<std::int64_t>();
    else if (v.is_number()) out = v.get<double>();
    else return fail(std::string("'") + key + "' must be a length");
    return true;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// "left + top", "left+top" or ["left", "top"].
bool read_alignment(const json& j, const char* key, std::optional<report_model::Alignment>& out) {
    if (!has(j, key)) return true;
    const json& v = j[key];
    report_model::Alignment align;
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        std::size_t start = 0;
        while (true) {
            const auto plus = s.find('+', start);
            align.push_back(trim(s.substr(start, plus == std::string::npos ? std::string::npos : plus - start)));
            if (plus == std::string::npos) break;
            start = plus + 1;
        }
    } else if (v.is_array()) {
        for (const auto& part : v) {
            if (!part.is_string()) return fail(std::string("'") + key + "' components must be strings");
            align.push_back(part.get<std::string>());
        }
    } else {
        return fail(std::string("'") + key + "' must be a string or a list of strings");
    }
    out = std::move(align);
    return true;
}

bool read_track_size(const json& v, report_model::TrackSize& out) {
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (s == "auto") out = report_model::AutoTrack{};
        else out = s;
    } else if (v.is_number_integer()) {
        out = v.get<std::int64_t>();
    } else if (v.is_number()) {
        out = v.get<double>();
    } else if (v.is_object() && v.contains("fr") && v["fr"].is_number()) {
        out = report_model::FractionTrack{ v["fr"].get<double>() };
    } else {
        return fail("track size must be \"auto\", a length, a number or {\"fr\": n}");
    }
    return true;
}

bool read_tracks(const json& j, const char* key, report_model::TrackDeclaration& out) {
    if (!has(j, key)) return true;
    const json& v = j[key];
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (s == "auto") out = report_model::AutoTrack{};
        else out = s;
    } else if (v.is_number_integer()) {
        out = v.get<std::int64_t>();
    } else if (v.is_number()) {
        out = v.get<double>();
    } else if (v.is_array()) {
        std::vector<report_model::TrackSize> sizes;
        for (const auto& item : v) {
            report_model::TrackSize size;
            if (!read_track_size(item, size)) return false;
            sizes.push_back(std::move(size));
        }
        out = std::move(sizes);
    } else {
        return fail(std::string("'") + key + "' must be \"auto\", a count or a list of track sizes");
    }
    return true;
}

bool read_style(const json& j, report_model::StyleSpec& out) {
    if (!read_dimension(j, "font_size", out.font_size)) return false;
    if (has(j, "font_weight")) {
        const json& w = j["font_weight"];
        if (w.is_string()) out.font_weight = w.get<std::string>();
        else if (w.is_number_integer()) out.font_weight = w.get<std::int64_t>();
        else return fail("'font_weight' must be a name or a number");
    }
    return read_string(j, "font_style", out.font_style)
        && read_string(j, "color", out.color)
        && read_string(j, "font_family", out.font_family)
        && read_string(j, "text_align", out.text_align);
}

// A content element may spell its text alignment as plain "align"; text_align wins when both are set.
void read_align_fallback(const json& j, report_model::StyleSpec& out) {
    if (out.text_align || !has(j, "align") || !j["align"].is_string()) return;
    out.text_align = j["align"].get<std::string>();
}

bool parse_layout_into(const json& j, report_model::LayoutSpec& out);

bool parse_element(const json& j, report_model::ElementSpec& out) {
    if (!j.is_object()) return fail("element must be an object");
    out.type = j.contains("type") && j["type"].is_string() ? j["type"].get<std::string>() : "";

    if (!read_string(j, "text", out.text)) return false;

    if (has(j, "source")) {
        const json& s = j["source"];
        std::vector<std::string> path;
        if (s.is_string()) {
            path.push_back(s.get<std::string>());
        } else if (s.is_array()) {
            for (const auto& key : s) {
                if (!key.is_string()) return fail("'source' keys must be strings");
                path.push_back(key.get<std::string>());
            }
        } else {
            return fail("'source' must be a key or a list of keys");
        }
        out.source = std::move(path);
    }

    std::optional<std::string> format;
    if (!read_string(j, "format", format)) return false;
    if (format) {
        out.format = report_model::field_format_from_string(*format);
        if (!out.format) return fail("unknown field format '" + *format + "'");
    }

    std::optional<std::int64_t> places;
    if (!read_int(j, "decimal_places", places)) return false;
    if (places) out.decimal_places = static_cast<int>(*places);

    if (!read_style(j, out.style)) return false;
    if (out.text || out.source) read_align_fallback(j, out.style);
    if (has(j, "style")) {
        if (!j["style"].is_object()) return fail("'style' must be an object");
        report_model::StyleSpec style_map;
        if (!read_style(j["style"], style_map)) return false;
        read_align_fallback(j["style"], style_map);
        out.style_map = std::move(style_map);
    }

    if (!out.text && !out.source && report_model::layout_kind_from_string(out.type)) {
        auto nested = std::make_shared<report_model::LayoutSpec>();
        if (!parse_layout_into(j, *nested)) return false;
        out.layout = std::move(nested);
    }
    return true;
}

bool parse_elements(const json& j, const char* key, std::vector<report_model::ElementSpec>& out) {
    if (!has(j, key)) return true;
    if (!j[key].is_array()) return fail(std::string("'") + key + "' must be a list");
    for (const auto& item : j[key]) {
        report_model::ElementSpec element;
        if (!parse_element(item, element)) return false;
        out.push_back(std::move(element));
    }
    return true;
}

bool parse_cell(const json& j, report_model::CellSpec& out) {
    if (!j.is_object()) return fail("cell must be an object");
    std::optional<std::int64_t> colspan;
    std::optional<std::int64_t> rowspan;
    if (!read_int(j, "x", out.x) || !read_int(j, "y", out.y)) return false;
    if (!read_int(j, "colspan", colspan) || !read_int(j, "rowspan", rowspan)) return false;
    out.colspan = colspan.value_or(1);
    out.rowspan = rowspan.value_or(1);
    return read_alignment(j, "align", out.align)
        && read_dimension(j, "inset", out.inset)
        && read_string(j, "fill", out.fill)
        && read_dimension(j, "stroke", out.stroke)
        && read_bool(j, "breakable", out.breakable)
        && parse_elements(j, "elements", out.elements);
}

bool is_layout_object(const json& j) {
    return j.contains("type") && j["type"].is_string()
        && report_model::layout_kind_from_string(j["type"].get<std::string>()).has_value();
}

// Inside a row: {"elements": [...]} is a cell, anything else an element.
bool is_cell_object(const json& j) {
    if (!j.is_object() || is_layout_object(j)) return false;
    return j.contains("elements") || (j.contains("type") && j["type"] == "cell");
}

// Inside a header or footer: {"cells": [...]} is a row, anything else a cell.
bool is_row_object(const json& j) {
    if (!j.is_object() || is_layout_object(j)) return false;
    return j.contains("cells") || (j.contains("type") && j["type"] == "row");
}

bool parse_row(const json& j, report_model::RowSpec& out) {
    if (!j.is_object()) return fail("row must be an object");
    if (!read_dimension(j, "height", out.height)
        || !read_string(j, "fill", out.fill)
        || !read_dimension(j, "stroke", out.stroke)
        || !read_alignment(j, "align", out.align)
        || !read_dimension(j, "inset", out.inset))
        return false;

    if (!has(j, "cells")) return true;
    if (!j["cells"].is_array()) return fail("'cells' of a row must be a list");
    for (const auto& item : j["cells"]) {
        if (is_cell_object(item)) {
            report_model::CellSpec cell;
            if (!parse_cell(item, cell)) return false;
            out.items.emplace_back(std::move(cell));
        } else {
            report_model::ElementSpec element;
            if (!parse_element(item, element)) return false;
            out.items.emplace_back(std::move(element));
        }
    }
    return true;
}

bool parse_section_entries(const json& j, std::vector<report_model::SectionEntry>& out) {
    if (!has(j, "rows")) return true;
    if (!j["rows"].is_array()) return fail("'rows' of a header or footer must be a list");
    for (const auto& item : j["rows"]) {
        if (is_row_object(item)) {
            report_model::RowSpec row;
            if (!parse_row(item, row)) return false;
            out.emplace_back(std::move(row));
        } else {
            report_model::CellSpec cell;
            if (!parse_cell(item, cell)) return false;
            out.emplace_back(std::move(cell));
        }
    }
    return true;
}

bool parse_line(const json& j, report_model::LineSpec& out) {
    if (!j.is_object()) return fail("line must be an object");
    std::optional<std::string> orientation;
    if (!read_string(j, "orientation", orientation)) return false;
    if (orientation && *orientation == "vertical") out.orientation = report_model::LineOrientation::Vertical;
    else if (orientation && *orientation != "horizontal") return fail("unknown line orientation '" + *orientation + "'");

    std::optional<std::int64_t> position;
    if (!read_int(j, "position", position)) return false;
    if (!position) return fail("line requires 'position'");
    out.position = *position;
    return read_int(j, "start", out.start)
        && read_int(j, "end", out.end)
        && read_dimension(j, "stroke", out.stroke);
}

template <typename T, typename Parse>
bool parse_list(const json& j, const char* key, std::vector<T>& out, Parse parse) {
    if (!has(j, key)) return true;
    if (!j[key].is_array()) return fail(std::string("'") + key + "' must be a list");
    for (const auto& item : j[key]) {
        T value;
        if (!parse(item, value)) return false;
        out.push_back(std::move(value));
    }
    return true;
}

bool parse_header(const json& j, report_model::HeaderSpec& out) {
    if (!j.is_object()) return fail("header must be an object");
    std::optional<std::int64_t> level;
    if (!read_bool(j, "repeat", out.repeat) || !read_int(j, "level", level)) return false;
    out.level = level.value_or(1);
    return parse_section_entries(j, out.entries);
}

bool parse_footer(const json& j, report_model::FooterSpec& out) {
    if (!j.is_object()) return fail("footer must be an object");
    return read_bool(j, "repeat", out.repeat) && parse_section_entries(j, out.entries);
}

bool parse_layout_into(const json& j, report_model::LayoutSpec& out) {
    if (!j.is_object()) return fail("layout must be an object");
    if (!j.contains("type") || !j["type"].is_string()) return fail("layout requires a 'type'");
    const std::string type = j["type"].get<std::string>();
    auto kind = report_model::layout_kind_from_string(type);
    if (!kind) return fail("unknown layout type '" + type + "'");
    out.kind = *kind;
    out.name = j.contains("name") && j["name"].is_string() ? j["name"].get<std::string>() : "";

    return read_tracks(j, "columns", out.columns)
        && read_tracks(j, "rows", out.rows)
        && read_dimension(j, "gutter", out.gutter)
        && read_dimension(j, "column_gutter", out.column_gutter)
        && read_dimension(j, "row_gutter", out.row_gutter)
        && read_alignment(j, "align", out.align)
        && read_dimension(j, "inset", out.inset)
        && read_string(j, "fill", out.fill)
        && read_dimension(j, "stroke", out.stroke)
        && read_string(j, "dir", out.dir)
        && read_dimension(j, "spacing", out.spacing)
        && parse_list(j, "row_entities", out.row_entities, parse_row)
        && parse_list(j, "cells", out.cells, parse_cell)
        && parse_elements(j, "elements", out.elements)
        && parse_list(j, "headers", out.headers, parse_header)
        && parse_list(j, "footers", out.footers, parse_footer)
        && parse_list(j, "lines", out.lines, parse_line);
}

bool read_document_value(const json& j, const char* key, std::optional<std::string>& out) {
    std::optional<report_model::Dimension> value;
    if (!read_dimension(j, key, value)) return false;
    if (!value) return true;
    if (const auto* s = std::get_if<std::string>(&*value)) out = *s;
    else if (const auto* i = std::get_if<std::int64_t>(&*value)) out = std::to_string(*i) + "pt";
    else out = nlohmann::json(std::get<double>(*value)).dump() + "pt";
    return true;
}

bool parse_document(const json& j, report_model::DocumentOptions& out) {
    if (!j.is_object()) return fail("'document' must be an object");
    return read_string(j, "page_size", out.page_size)
        && read_document_value(j, "margin", out.margin)
        && read_string(j, "font", out.font)
        && read_document_value(j, "font_size", out.font_size);
}

} // namespace

std::optional<report_model::LayoutSpec> parse_layout(const nlohmann::json& j) {
    report_model::LayoutSpec layout;
    if (!parse_layout_into(j, layout)) return std::nullopt;
    return layout;
}

std::optional<report_model::ReportSpec> parse_report(const nlohmann::json& j) {
    if (!j.is_object()) {
        fail("report must be an object");
        return std::nullopt;
    }

    report_model::ReportSpec report;
    if (j.contains("name") && j["name"].is_string()) report.name = j["name"].get<std::string>();
    if (has(j, "document") && !parse_document(j["document"], report.document)) return std::nullopt;

    if (!j.contains("layouts")) {
        auto layout = parse_layout(j);
        if (!layout) return std::nullopt;
        report.layouts.push_back(std::move(*layout));
        return report;
    }

    if (!j["layouts"].is_array()) {
        fail("'layouts' must be a list");
        return std::nullopt;
    }
    for (const auto& item : j["layouts"]) {
        auto layout = parse_layout(item);
        if (!layout) return std::nullopt;
        report.layouts.push_back(std::move(*layout));
    }
    return report;
}

std::optional<report_model::ReportSpec> load_report_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_report(j);
    } catch (const nlohmann::json::exception& e) {
        report_log::logger()->error("Cannot parse report JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<report_model::ReportSpec> load_report_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        report_log::logger()->debug("Report file not readable: {}", path);
        return std::nullopt;
    }
    report_log::logger()->info("Loading report from {}", path);
    return load_report_from_json(f);
}

std::optional<nlohmann::json> load_data_from_json(std::istream& in) {
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        report_log::logger()->error("Cannot parse data JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<nlohmann::json> load_data_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        report_log::logger()->error("Data file not readable: {}", path);
        return std::nullopt;
    }
    return load_data_from_json(f);
}

} // namespace report_loaders
