#pragma once

#include <report_ir/ir.hpp>
#include <report_model/types.hpp>
#include <report_transform/errors.hpp>
#include <cstddef>

namespace report_transform {

// Single-content cell with default span and no properties.
report_ir::Cell wrap_content(report_ir::Content content, report_ir::Position position = {});

// Explicit x/y win over `default_position`.
Result<report_ir::Cell> assemble_cell(const report_model::CellSpec& spec,
                                      report_ir::Position default_position = {});

// Cells without explicit coordinates are placed left to right on row `index`.
Result<report_ir::Row> assemble_row(const report_model::RowSpec& spec, std::size_t index);

Result<report_ir::Header> assemble_header(const report_model::HeaderSpec& spec);
Result<report_ir::Footer> assemble_footer(const report_model::FooterSpec& spec);

} // namespace report_transform
