#include <report_render/renderer.hpp>
#include <report_render/escape.hpp>
#include <report_render/lines.hpp>
#include <report_render/markup_constants.hpp>
#include <report_render/references.hpp>
#include <report_render/styling.hpp>
#include <report_log/logger.hpp>
#include <type_traits>

namespace report_render {

namespace {

std::string pad(int level) {
    std::string out;
    for (int i = 0; i < level; ++i)
        out += markup::indent_unit;
    return out;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

bool uses_references(const RenderOptions& options) {
    return options.generate_refs || options.data == nullptr;
}

const char* function_prefix(report_ir::LayoutKind kind) {
    return report_model::to_string(kind);
}

std::string render_alignment(const report_ir::Alignment& align) {
    return join(align, markup::alignment_separator);
}

std::string render_tracks(const std::vector<std::string>& tracks) {
    return "(" + join(tracks, ", ") + ")";
}

// Opening line, one argument per line (each followed by a comma), closing paren at `indent`.
// The opening line carries no indentation; the caller places it.
std::string render_call(const std::string& name, const std::vector<std::string>& arguments, int indent) {
    std::string out = "#" + name + "(\n";
    for (const auto& argument : arguments)
        out += pad(indent + 1) + argument + ",\n";
    return out + pad(indent) + ")";
}

std::vector<std::string> cell_parameters(const report_ir::Cell& cell) {
    std::vector<std::string> params;
    const auto& props = cell.properties;
    if (cell.span.colspan > 1) params.push_back("colspan: " + std::to_string(cell.span.colspan));
    if (cell.span.rowspan > 1) params.push_back("rowspan: " + std::to_string(cell.span.rowspan));
    if (props.align) params.push_back("align: " + render_alignment(*props.align));
    if (props.fill) params.push_back("fill: " + render_color(*props.fill));
    if (props.inset) params.push_back("inset: " + *props.inset);
    if (props.stroke) params.push_back("stroke: " + *props.stroke);
    if (props.breakable) params.push_back(std::string("breakable: ") + (*props.breakable ? "true" : "false"));
    return params;
}

std::vector<std::string> layout_parameters(const report_ir::LayoutProperties& props) {
    std::vector<std::string> params;
    if (!props.columns.empty()) params.push_back("columns: " + render_tracks(props.columns));
    if (!props.rows.empty()) params.push_back("rows: " + render_tracks(props.rows));
    if (props.gutter) params.push_back("gutter: " + *props.gutter);
    if (props.column_gutter) params.push_back("column-gutter: " + *props.column_gutter);
    if (props.row_gutter) params.push_back("row-gutter: " + *props.row_gutter);
    if (props.align) params.push_back("align: " + render_alignment(*props.align));
    if (props.inset) params.push_back("inset: " + *props.inset);
    if (props.fill) params.push_back("fill: " + render_color(*props.fill));
    if (props.stroke) params.push_back("stroke: " + *props.stroke);
    return params;
}

std::vector<std::string> stack_parameters(const report_ir::LayoutProperties& props) {
    std::vector<std::string> params;
    if (props.dir) params.push_back("dir: " + *props.dir);
    if (props.spacing) params.push_back("spacing: " + *props.spacing);
    return params;
}

std::string render_cell_body(const report_ir::Cell& cell, int indent, const RenderOptions& options) {
    std::vector<std::string> parts;
    parts.reserve(cell.content.size());
    for (const auto& content : cell.content)
        parts.push_back(render_content(content, indent, options));
    return "[" + join(parts, markup::content_separator) + "]";
}

void append_row_cells(std::vector<std::string>& arguments, const report_ir::Row& row, report_ir::LayoutKind kind,
                      int indent, const RenderOptions& options) {
    for (const auto& cell : row.cells)
        arguments.push_back(render_cell(cell, kind, indent, options));
}

// table.header(repeat: true, ...) / table.footer(repeat: false, ...) with one cell per line.
std::string render_section(const char* name, bool repeat, std::int64_t level, const std::vector<report_ir::Row>& rows,
                           int indent, const RenderOptions& options) {
    std::vector<std::string> params;
    params.push_back(std::string("repeat: ") + (repeat ? "true" : "false"));
    if (level > 1) params.push_back("level: " + std::to_string(level));

    std::vector<std::string> cells;
    for (const auto& row : rows)
        append_row_cells(cells, row, report_ir::LayoutKind::Table, indent + 1, options);

    std::string out = std::string("table.") + name + "(" + join(params, ", ");
    if (cells.empty()) return out + ")";
    out += ",\n";
    for (const auto& cell : cells)
        out += pad(indent + 1) + cell + ",\n";
    return out + pad(indent) + ")";
}

std::string render_layout_body(const report_ir::Layout& layout, int indent, const RenderOptions& options);

std::string render_grid_or_table(const report_ir::Layout& layout, int indent, const RenderOptions& options) {
    std::vector<std::string> arguments = layout_parameters(layout.properties);

    for (const auto& header : layout.headers)
        arguments.push_back(render_section("header", header.repeat, header.level, header.rows, indent + 1, options));

    for (const auto& child : layout.children) {
        if (const auto* row = std::get_if<report_ir::Row>(&child))
            append_row_cells(arguments, *row, layout.kind, indent + 1, options);
        else
            arguments.push_back(render_cell(std::get<report_ir::Cell>(child), layout.kind, indent + 1, options));
    }

    for (const auto& footer : layout.footers)
        arguments.push_back(render_section("footer", footer.repeat, 1, footer.rows, indent + 1, options));

    for (const auto& line : layout.lines)
        arguments.push_back(render_line(line, layout.kind));

    return render_call(function_prefix(layout.kind), arguments, indent);
}

std::string render_stack(const report_ir::Layout& layout, int indent, const RenderOptions& options) {
    std::vector<std::string> arguments = stack_parameters(layout.properties);
    for (const auto& child : layout.children) {
        if (const auto* cell = std::get_if<report_ir::Cell>(&child)) {
            arguments.push_back(render_cell_body(*cell, indent + 1, options));
            continue;
        }
        for (const auto& cell : std::get<report_ir::Row>(child).cells)
            arguments.push_back(render_cell_body(cell, indent + 1, options));
    }
    return render_call("stack", arguments, indent);
}

std::string render_layout_body(const report_ir::Layout& layout, int indent, const RenderOptions& options) {
    if (layout.kind == report_ir::LayoutKind::Stack) return render_stack(layout, indent, options);
    return render_grid_or_table(layout, indent, options);
}

std::string render_label(const report_ir::Label& label, const RenderOptions& options) {
    const std::string text = options.generate_refs ? render_label_references(label.text) : escape_markup(label.text);
    return apply_style(text, label.style);
}

std::string render_field(const report_ir::Field& field, const RenderOptions& options) {
    if (uses_references(options))
        return apply_style(render_field_reference(field, options.format), field.style);

    const nlohmann::json* value = lookup_field(*options.data, field.source);
    const std::string text = format_value(value, field.format, field.decimal_places, options.format);
    return apply_style(escape_markup(text), field.style);
}

} // namespace

std::string render_content(const report_ir::Content& content, int indent, const RenderOptions& options) {
    return std::visit([&](const auto& item) -> std::string {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, report_ir::Label>)
            return render_label(item, options);
        else if constexpr (std::is_same_v<T, report_ir::Field>)
            return render_field(item, options);
        else
            return item.layout ? render_layout_body(*item.layout, indent, options) : std::string();
    }, content);
}

std::string render_cell(const report_ir::Cell& cell, report_ir::LayoutKind kind, int indent,
                        const RenderOptions& options) {
    const std::string body = render_cell_body(cell, indent, options);
    const auto params = cell_parameters(cell);
    if (params.empty()) return body;
    return std::string(function_prefix(kind)) + ".cell(" + join(params, ", ") + ")" + body;
}

std::string render(const report_ir::Layout& layout, const RenderOptions& options) {
    return pad(options.indent) + render_layout_body(layout, options.indent, options);
}

std::string render_layouts(const std::vector<report_ir::Layout>& layouts, const RenderOptions& options) {
    std::vector<std::string> parts;
    parts.reserve(layouts.size());
    for (const auto& layout : layouts)
        parts.push_back(render(layout, options));
    return join(parts, markup::block_separator);
}

std::string build_preamble(const report_model::DocumentOptions& document) {
    std::vector<std::string> lines;
    if (document.page_size) lines.push_back("#set page(paper: " + quote(*document.page_size) + ")");
    if (document.margin) lines.push_back("#set page(margin: " + *document.margin + ")");
    if (document.font) lines.push_back("#set text(font: " + quote(*document.font) + ")");
    if (document.font_size) lines.push_back("#set text(size: " + *document.font_size + ")");
    return join(lines, "\n");
}

std::string render_report(const std::vector<report_ir::Layout>& layouts,
                          const report_model::DocumentOptions& document,
                          const RenderOptions& options) {
    const std::string preamble = build_preamble(document);
    const std::string body = render_layouts(layouts, options);
    report_log::logger()->debug("Rendered {} layouts ({} bytes, references: {})",
                                layouts.size(), body.size(), uses_references(options));
    if (preamble.empty()) return body;
    return preamble + std::string(markup::block_separator) + body;
}

} // namespace report_render
