#include <report_render/lines.hpp>
#include <vector>

namespace report_render {

std::string render_line(const report_ir::Line& line, report_ir::LayoutKind kind) {
    const bool horizontal = line.orientation == report_ir::LineOrientation::Horizontal;
    const char* prefix = kind == report_ir::LayoutKind::Table ? "table" : "grid";

    std::vector<std::string> params;
    params.push_back(std::string(horizontal ? "y: " : "x: ") + std::to_string(line.position));
    if (line.start) params.push_back("start: " + std::to_string(*line.start));
    if (line.end) params.push_back("end: " + std::to_string(*line.end));
    if (line.stroke) params.push_back("stroke: " + *line.stroke);

    std::string out = std::string(prefix) + (horizontal ? ".hline(" : ".vline(");
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (i > 0) out += ", ";
        out += params[i];
    }
    return out + ")";
}

} // namespace report_render
