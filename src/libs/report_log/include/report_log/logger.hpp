#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace report_log {

// Process-wide logger shared by the libraries and the CLI. Writes to stderr.
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

// Maps a level name (trace, debug, info, warn/warning, err/error, critical, off) to its enum.
// Returns nullopt for any other name.
std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

// Also write log records to `path` (truncated). Returns false if the file cannot be opened.
bool add_file_sink(const std::string& path);

} // namespace report_log
