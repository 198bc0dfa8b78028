#pragma once

#include <report_model/types.hpp>
#include <report_transform/errors.hpp>
#include <string>
#include <vector>

namespace report_transform {

enum class TrackAxis { Columns, Rows };

const char* to_string(TrackAxis axis);

// Turns an authored column/row declaration into canonical track tokens:
//   unset -> []            auto -> ["auto"]          3 -> ["auto", "auto", "auto"]
//   [auto, {fr 2}, "1fr", 80] -> ["auto", "2fr", "1fr", "80pt"]
// Non-positive counts, counts above defaults::max_track_count, fractional counts and bare
// top-level strings are rejected with invalid_track_definition naming the axis.
Result<std::vector<std::string>> normalize_tracks(const report_model::TrackDeclaration& declaration,
                                                  TrackAxis axis);

std::string normalize_track_size(const report_model::TrackSize& size);

} // namespace report_transform
