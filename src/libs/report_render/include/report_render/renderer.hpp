#pragma once

#include <report_ir/ir.hpp>
#include <report_model/report.hpp>
#include <report_render/value_format.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace report_render {

struct RenderOptions {
    // Data context for fields. When null, fields render as references to `record`.
    const nlohmann::json* data = nullptr;
    // Emit field references even when data is present, and turn `[name]` in labels
    // into variable references. Without it labels are always literal text.
    bool generate_refs = false;
    // Indentation level of the outermost layout.
    int indent = 0;
    FormatOptions format;
};

// Typst markup for one layout tree. Pure: the same IR and options always produce
// byte-identical output.
std::string render(const report_ir::Layout& layout, const RenderOptions& options = {});

// Layouts separated by a blank line.
std::string render_layouts(const std::vector<report_ir::Layout>& layouts, const RenderOptions& options = {});

// #set rules for the provided document options, one per line; empty when none are set.
std::string build_preamble(const report_model::DocumentOptions& document);

// Preamble (if any), blank line, then all layouts.
std::string render_report(const std::vector<report_ir::Layout>& layouts,
                          const report_model::DocumentOptions& document,
                          const RenderOptions& options = {});

// Building blocks, exposed for tests and alternative assemblers.
std::string render_content(const report_ir::Content& content, int indent, const RenderOptions& options);
std::string render_cell(const report_ir::Cell& cell, report_ir::LayoutKind kind, int indent,
                        const RenderOptions& options);

} // namespace report_render
