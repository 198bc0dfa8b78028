#include <report_transform/cells.hpp>
#include <report_transform/content.hpp>
#include <report_transform/properties.hpp>
#include <string>
#include <vector>

namespace report_transform {

namespace {

// Lowers header/footer entries; a bare cell becomes a one-cell row at the entry's position.
Result<std::vector<report_ir::Row>> assemble_section_rows(const std::vector<report_model::SectionEntry>& entries) {
    std::vector<report_ir::Row> rows;
    rows.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (const auto* row_spec = std::get_if<report_model::RowSpec>(&entries[i])) {
            auto row = assemble_row(*row_spec, i);
            if (!row) return row.error();
            rows.push_back(std::move(row).value());
            continue;
        }

        const report_ir::Position position{ 0, static_cast<std::int64_t>(i) };
        auto cell = assemble_cell(std::get<report_model::CellSpec>(entries[i]), position);
        if (!cell) return cell.error();
        report_ir::Row row;
        row.index = i;
        row.cells.push_back(std::move(cell).value());
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace

report_ir::Cell wrap_content(report_ir::Content content, report_ir::Position position) {
    report_ir::Cell cell;
    cell.position = position;
    cell.content.push_back(std::move(content));
    return cell;
}

Result<report_ir::Cell> assemble_cell(const report_model::CellSpec& spec, report_ir::Position default_position) {
    if (spec.colspan < 1) return invalid_property("colspan", std::to_string(spec.colspan));
    if (spec.rowspan < 1) return invalid_property("rowspan", std::to_string(spec.rowspan));

    report_ir::Cell cell;
    cell.position.column = spec.x.value_or(default_position.column);
    cell.position.row = spec.y.value_or(default_position.row);
    cell.span = report_ir::Span{ spec.colspan, spec.rowspan };

    LayoutError error;
    if (!normalize_alignment(spec.align, cell.properties.align, error)) return error;
    cell.properties.inset = normalize_length(spec.inset);
    cell.properties.fill = spec.fill;
    cell.properties.stroke = normalize_length(spec.stroke);
    cell.properties.breakable = spec.breakable;

    cell.content.reserve(spec.elements.size());
    for (const auto& element : spec.elements) {
        auto content = lower_element(element);
        if (!content) return content.error();
        cell.content.push_back(std::move(content).value());
    }
    return cell;
}

Result<report_ir::Row> assemble_row(const report_model::RowSpec& spec, std::size_t index) {
    report_ir::Row row;
    row.index = index;

    LayoutError error;
    if (!normalize_alignment(spec.align, row.properties.align, error)) return error;
    row.properties.height = normalize_length(spec.height);
    row.properties.fill = spec.fill;
    row.properties.stroke = normalize_length(spec.stroke);
    row.properties.inset = normalize_length(spec.inset);

    std::int64_t column = 0;
    const auto row_number = static_cast<std::int64_t>(index);
    row.cells.reserve(spec.items.size());
    for (const auto& item : spec.items) {
        const report_ir::Position position{ column, row_number };
        if (const auto* cell_spec = std::get_if<report_model::CellSpec>(&item)) {
            auto cell = assemble_cell(*cell_spec, position);
            if (!cell) return cell.error();
            column = cell.value().position.column + cell.value().span.colspan;
            row.cells.push_back(std::move(cell).value());
        } else {
            auto content = lower_element(std::get<report_model::ElementSpec>(item));
            if (!content) return content.error();
            row.cells.push_back(wrap_content(std::move(content).value(), position));
            ++column;
        }
    }
    return row;
}

Result<report_ir::Header> assemble_header(const report_model::HeaderSpec& spec) {
    if (spec.level < 1) return invalid_property("level", std::to_string(spec.level));
    auto rows = assemble_section_rows(spec.entries);
    if (!rows) return rows.error();

    report_ir::Header header;
    header.repeat = spec.repeat.value_or(true);
    header.level = spec.level;
    header.rows = std::move(rows).value();
    return header;
}

Result<report_ir::Footer> assemble_footer(const report_model::FooterSpec& spec) {
    auto rows = assemble_section_rows(spec.entries);
    if (!rows) return rows.error();

    report_ir::Footer footer;
    footer.repeat = spec.repeat.value_or(false);
    footer.rows = std::move(rows).value();
    return footer;
}

} // namespace report_transform
