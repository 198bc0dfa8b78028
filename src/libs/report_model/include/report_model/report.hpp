#pragma once

#include <report_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace report_model {

// Page and text settings emitted ahead of the rendered layouts.
struct DocumentOptions {
    std::optional<std::string> page_size;
    std::optional<std::string> margin;
    std::optional<std::string> font;
    std::optional<std::string> font_size;
};

struct ReportSpec {
    std::string name;
    DocumentOptions document;
    std::vector<LayoutSpec> layouts;
};

} // namespace report_model
