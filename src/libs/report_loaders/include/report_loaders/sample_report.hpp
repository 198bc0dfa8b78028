#pragma once

#include <report_model/report.hpp>
#include <nlohmann/json.hpp>

namespace report_loaders {

// Built-in invoice used when no report file is available.
report_model::ReportSpec generate_sample_report();
nlohmann::json generate_sample_data();

} // namespace report_loaders
