#include <report_log/logger.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace report_log {

namespace {

constexpr const char* logger_name = "report_layout";
constexpr const char* log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::mutex logger_mutex;

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance;
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (instance) return instance;

    try {
        instance = spdlog::get(logger_name);
        if (!instance) instance = spdlog::stderr_color_mt(logger_name);
        instance->set_level(spdlog::level::warn);
        instance->set_pattern(log_pattern);
    } catch (const spdlog::spdlog_ex&) {
        instance = spdlog::default_logger();
    }
    return instance;
}

void set_level(spdlog::level::level_enum level) {
    auto log = logger();
    log->set_level(level);
    for (auto& sink : log->sinks())
        sink->set_level(level);
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    if (name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") return std::nullopt;
    return level;
}

bool add_file_sink(const std::string& path) {
    auto log = logger();
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
        sink->set_pattern(log_pattern);
        sink->set_level(log->level());
        log->sinks().push_back(std::move(sink));
        log->flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
        log->error("Cannot open log file {}: {}", path, e.what());
        return false;
    }
    log->info("Log file opened. file={}", path);
    return true;
}

} // namespace report_log
