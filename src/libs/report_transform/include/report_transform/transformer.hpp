#pragma once

#include <report_ir/ir.hpp>
#include <report_model/report.hpp>
#include <report_model/types.hpp>
#include <report_transform/errors.hpp>
#include <vector>

namespace report_transform {

// Builds the IR for one authored layout, nested layouts included. The first error
// anywhere in the tree aborts the transform; no partial IR is returned.
Result<report_ir::Layout> transform(const report_model::LayoutSpec& spec);

// Transforms every layout of the report in order. Fails on the first layout that fails.
Result<std::vector<report_ir::Layout>> transform_report(const report_model::ReportSpec& report);

} // namespace report_transform
