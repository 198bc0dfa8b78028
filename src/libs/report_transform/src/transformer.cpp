#include <report_transform/transformer.hpp>
#include <report_transform/cells.hpp>
#include <report_transform/content.hpp>
#include <report_transform/defaults.hpp>
#include <report_transform/properties.hpp>
#include <report_transform/tracks.hpp>
#include <report_log/logger.hpp>
#include <algorithm>
#include <string>

namespace report_transform {

namespace {

bool is_stack_direction(const std::string& s) {
    return std::find(defaults::stack_directions.begin(), defaults::stack_directions.end(), s)
        != defaults::stack_directions.end();
}

// Rows, then loose cells, then bare elements wrapped into cells.
bool lower_children(const report_model::LayoutSpec& spec, std::vector<report_ir::Child>& out, LayoutError& error) {
    out.reserve(spec.row_entities.size() + spec.cells.size() + spec.elements.size());

    for (std::size_t i = 0; i < spec.row_entities.size(); ++i) {
        auto row = assemble_row(spec.row_entities[i], i);
        if (!row) {
            error = row.error();
            return false;
        }
        out.emplace_back(std::move(row).value());
    }

    for (const auto& cell_spec : spec.cells) {
        auto cell = assemble_cell(cell_spec);
        if (!cell) {
            error = cell.error();
            return false;
        }
        out.emplace_back(std::move(cell).value());
    }

    for (const auto& element : spec.elements) {
        auto content = lower_element(element);
        if (!content) {
            error = content.error();
            return false;
        }
        out.emplace_back(wrap_content(std::move(content).value()));
    }
    return true;
}

report_ir::Line lower_line(const report_model::LineSpec& spec) {
    report_ir::Line line;
    line.orientation = spec.orientation;
    line.position = spec.position;
    line.start = spec.start;
    line.end = spec.end;
    line.stroke = normalize_length(spec.stroke);
    return line;
}

Result<report_ir::Layout> transform_stack(const report_model::LayoutSpec& spec) {
    if (!spec.row_entities.empty() || !spec.cells.empty() || !spec.headers.empty() || !spec.lines.empty())
        report_log::logger()->warn("Stack '{}' only uses its elements; rows, cells, headers and lines are ignored",
                                   spec.name);

    report_ir::Layout layout;
    layout.kind = report_model::LayoutKind::Stack;

    if (spec.dir) {
        if (!is_stack_direction(*spec.dir)) return invalid_property("dir", *spec.dir);
        layout.properties.dir = spec.dir;
    }
    layout.properties.spacing = normalize_length(spec.spacing);

    layout.children.reserve(spec.elements.size());
    for (const auto& element : spec.elements) {
        auto content = lower_element(element);
        if (!content) return content.error();
        layout.children.emplace_back(wrap_content(std::move(content).value()));
    }
    return layout;
}

Result<report_ir::Layout> transform_grid_or_table(const report_model::LayoutSpec& spec) {
    const bool is_table = spec.kind == report_model::LayoutKind::Table;

    auto columns = normalize_tracks(spec.columns, TrackAxis::Columns);
    if (!columns) return columns.error();
    auto rows = normalize_tracks(spec.rows, TrackAxis::Rows);
    if (!rows) return rows.error();

    report_ir::Layout layout;
    layout.kind = spec.kind;

    auto& props = layout.properties;
    props.columns = std::move(columns).value();
    props.rows = std::move(rows).value();
    props.column_gutter = normalize_length(spec.column_gutter);
    props.row_gutter = normalize_length(spec.row_gutter);
    // Axis-specific gutters replace the shared one.
    if (!props.column_gutter && !props.row_gutter)
        props.gutter = normalize_length(spec.gutter);

    LayoutError error;
    if (!normalize_alignment(spec.align, props.align, error)) return error;
    props.inset = normalize_length(spec.inset);
    props.fill = spec.fill;
    props.stroke = normalize_length(spec.stroke);
    if (is_table) {
        if (!props.stroke) props.stroke = std::string(defaults::table_stroke);
        if (!props.inset) props.inset = std::string(defaults::table_inset);
    }

    if (!lower_children(spec, layout.children, error)) return error;

    if (is_table) {
        for (const auto& header_spec : spec.headers) {
            auto header = assemble_header(header_spec);
            if (!header) return header.error();
            layout.headers.push_back(std::move(header).value());
        }
        for (const auto& footer_spec : spec.footers) {
            auto footer = assemble_footer(footer_spec);
            if (!footer) return footer.error();
            layout.footers.push_back(std::move(footer).value());
        }
    } else if (!spec.headers.empty() || !spec.footers.empty()) {
        report_log::logger()->warn("Grid '{}' has headers or footers; only tables repeat them", spec.name);
    }

    layout.lines.reserve(spec.lines.size());
    for (const auto& line : spec.lines)
        layout.lines.push_back(lower_line(line));

    return layout;
}

} // namespace

Result<report_ir::Layout> transform(const report_model::LayoutSpec& spec) {
    auto result = spec.kind == report_model::LayoutKind::Stack ? transform_stack(spec) : transform_grid_or_table(spec);
    if (!result) {
        report_log::logger()->debug("Transform of {} '{}' failed: {}",
                                    report_model::to_string(spec.kind), spec.name, result.error().message());
        return result;
    }
    report_log::logger()->trace("Transformed {} '{}' with {} children",
                                report_model::to_string(spec.kind), spec.name, result.value().children.size());
    return result;
}

Result<std::vector<report_ir::Layout>> transform_report(const report_model::ReportSpec& report) {
    std::vector<report_ir::Layout> layouts;
    layouts.reserve(report.layouts.size());
    for (const auto& spec : report.layouts) {
        auto layout = transform(spec);
        if (!layout) return layout.error();
        layouts.push_back(std::move(layout).value());
    }
    report_log::logger()->debug("Transformed report '{}' ({} layouts)", report.name, layouts.size());
    return layouts;
}

} // namespace report_transform
