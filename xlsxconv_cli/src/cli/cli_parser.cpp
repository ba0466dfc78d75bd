#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

namespace {
std::string trimmed(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Print only the conversion log, no summary table.");

    app.add_option("input", settings.input,
                   "An .xlsx file, or a directory searched recursively for .xlsx files.")
        ->required();

    app.add_option("-o,--output", settings.output_dir,
                   "Directory for the .csv files (created if missing).")
        ->required();

    app.add_option("-s,--sheet", settings.sheet,
                   "Sheet to convert: zero-based index or sheet name.")
        ->default_val("0");

    app.add_option("-e,--encoding", settings.encoding,
                   "Text encoding of the written files (utf-8, utf-8-sig, or any iconv name).")
        ->default_val("utf-8");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->default_val("ERROR")
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write diagnostics to this file.");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
        ->take_last();

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        settings.input = trimmed(settings.input);
        settings.output_dir = trimmed(settings.output_dir);
        settings.encoding = trimmed(settings.encoding);

        if (settings.input.empty()) {
            throw CLI::ValidationError("input", "Select the file or folder to convert.");
        }
        if (settings.output_dir.empty()) {
            throw CLI::ValidationError("--output", "Select an output folder.");
        }
        if (settings.encoding.empty()) {
            settings.encoding = "utf-8";
        }
    });
}
