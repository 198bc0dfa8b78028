// Report layout compiler: JSON layout description -> Typst markup (C++20)

#include <report_loaders/json_loader.hpp>
#include <report_loaders/sample_report.hpp>
#include <report_log/logger.hpp>
#include <report_render/renderer.hpp>
#include <report_transform/transformer.hpp>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct CliOptions {
    std::optional<std::string> report_path;
    std::optional<std::string> data_path;
    std::optional<std::string> output_path;
    report_model::DocumentOptions document_overrides;
    std::optional<std::string> currency_symbol;
    bool generate_refs = false;
    std::string log_level = "warn";
    std::optional<std::string> log_file;
    bool help = false;
};

void print_usage(const char* program) {
    (void)fprintf(stderr,
        "Usage: %s [--report <file>] [--data <file>] [--output <file>]\n"
        "          [--page-size <name>] [--margin <length>] [--font <name>] [--font-size <length>]\n"
        "          [--currency <symbol>] [--refs] [--log-level <level>] [--log-file <file>]\n",
        program);
}

// Returns false on an unknown flag or a flag missing its value.
bool parse_arguments(int argc, char* argv[], CliOptions& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::optional<std::string>& into) {
            if (i + 1 >= argc) {
                (void)fprintf(stderr, "Missing value for %s\n", arg.c_str());
                return false;
            }
            into = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") out.help = true;
        else if (arg == "--refs") out.generate_refs = true;
        else if (arg == "--report") { if (!value(out.report_path)) return false; }
        else if (arg == "--data") { if (!value(out.data_path)) return false; }
        else if (arg == "--output") { if (!value(out.output_path)) return false; }
        else if (arg == "--page-size") { if (!value(out.document_overrides.page_size)) return false; }
        else if (arg == "--margin") { if (!value(out.document_overrides.margin)) return false; }
        else if (arg == "--font") { if (!value(out.document_overrides.font)) return false; }
        else if (arg == "--font-size") { if (!value(out.document_overrides.font_size)) return false; }
        else if (arg == "--currency") { if (!value(out.currency_symbol)) return false; }
        else if (arg == "--log-file") { if (!value(out.log_file)) return false; }
        else if (arg == "--log-level") {
            std::optional<std::string> level;
            if (!value(level)) return false;
            out.log_level = *level;
        } else {
            (void)fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            return false;
        }
    }
    return true;
}

void apply_overrides(report_model::DocumentOptions& document, const report_model::DocumentOptions& overrides) {
    if (overrides.page_size) document.page_size = overrides.page_size;
    if (overrides.margin) document.margin = overrides.margin;
    if (overrides.font) document.font = overrides.font;
    if (overrides.font_size) document.font_size = overrides.font_size;
}

} // namespace

int main(int argc, char* argv[])
{
    CliOptions options;
    if (!parse_arguments(argc, argv, options)) {
        print_usage(argv[0]);
        return 2;
    }
    if (options.help) {
        print_usage(argv[0]);
        return 0;
    }

    const auto level = report_log::parse_level(options.log_level);
    if (!level) {
        (void)fprintf(stderr, "Unknown log level: %s\n", options.log_level.c_str());
        print_usage(argv[0]);
        return 2;
    }
    report_log::set_level(*level);
    if (options.log_file && !report_log::add_file_sink(*options.log_file))
        return 1;
    auto log = report_log::logger();

    std::optional<report_model::ReportSpec> report;
    bool using_sample = false;
    if (options.report_path) {
        report = report_loaders::load_report_from_json_file(*options.report_path);
        if (!report) {
            log->error("Cannot load report {}", *options.report_path);
            return 1;
        }
    } else {
        const char* report_paths[] = { "data/example_report.json", "example_report.json" };
        for (const char* path : report_paths) {
            report = report_loaders::load_report_from_json_file(path);
            if (report) break;
        }
        if (!report) {
            log->info("No report file found, using the built-in sample report");
            report = report_loaders::generate_sample_report();
            using_sample = true;
        }
    }
    apply_overrides(report->document, options.document_overrides);

    std::optional<nlohmann::json> data;
    if (options.data_path) {
        data = report_loaders::load_data_from_json_file(*options.data_path);
        if (!data) return 1;
    } else if (using_sample) {
        data = report_loaders::generate_sample_data();
    }

    auto layouts = report_transform::transform_report(*report);
    if (!layouts) {
        const auto& error = layouts.error();
        log->error("Layout error in report '{}': {} ({})", report->name, error.message(), error.tag());
        return 1;
    }

    report_render::RenderOptions render_options;
    render_options.data = data ? &*data : nullptr;
    render_options.generate_refs = options.generate_refs;
    if (options.currency_symbol) render_options.format.currency_symbol = *options.currency_symbol;

    const std::string markup = report_render::render_report(layouts.value(), report->document, render_options);

    if (!options.output_path) {
        std::cout << markup << '\n';
        return 0;
    }

    std::ofstream out(*options.output_path);
    if (!out) {
        log->error("Cannot open output file {}", *options.output_path);
        return 1;
    }
    out << markup << '\n';
    if (!out) {
        log->error("Cannot write output file {}", *options.output_path);
        return 1;
    }
    log->info("Wrote {} ({} layouts)", *options.output_path, layouts.value().size());
    return 0;
}
