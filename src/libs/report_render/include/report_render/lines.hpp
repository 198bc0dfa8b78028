#pragma once

#include <report_ir/ir.hpp>
#include <string>

namespace report_render {

// grid.hline(y: 2, start: 0, end: 3, stroke: 2pt), table.vline(x: 1), ...
std::string render_line(const report_ir::Line& line, report_ir::LayoutKind kind);

} // namespace report_render
