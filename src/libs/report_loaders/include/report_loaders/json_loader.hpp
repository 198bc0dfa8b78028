#pragma once

#include <report_model/report.hpp>
#include <report_model/types.hpp>
#include <nlohmann/json.hpp>
#include <istream>
#include <optional>
#include <string>

namespace report_loaders {

// A report document is either {"name", "document", "layouts": [...]} or a single layout object.
// Malformed input is logged and yields nullopt.
std::optional<report_model::ReportSpec> load_report_from_json(std::istream& in);
std::optional<report_model::ReportSpec> load_report_from_json_file(const std::string& path);

std::optional<report_model::ReportSpec> parse_report(const nlohmann::json& j);
std::optional<report_model::LayoutSpec> parse_layout(const nlohmann::json& j);

// Data context for field lookups. Any JSON value is accepted.
std::optional<nlohmann::json> load_data_from_json(std::istream& in);
std::optional<nlohmann::json> load_data_from_json_file(const std::string& path);

} // namespace report_loaders
