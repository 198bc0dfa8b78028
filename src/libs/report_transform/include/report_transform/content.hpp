#pragma once

#include <report_ir/ir.hpp>
#include <report_model/types.hpp>
#include <report_transform/errors.hpp>
#include <optional>

namespace report_transform {

// Lowers one authored item: text -> Label, source -> Field, layout -> NestedLayout
// (transformed recursively). Anything else is unknown_element_type.
Result<report_ir::Content> lower_element(const report_model::ElementSpec& element);

// Flat attributes overlaid with the explicit style map. nullopt when nothing is set.
// text_align must be an alignment component or "justify", otherwise invalid_property.
Result<std::optional<report_ir::Style>> resolve_element_style(const report_model::ElementSpec& element);

report_ir::Style lower_style(const report_model::StyleSpec& style);

} // namespace report_transform
