#include <chrono>
#include <clocale>
#include <future>
#include <iostream>
#include <string>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/message_queue.hpp"
#include "../../libxlsxconv/include/logger.hpp"
#include "../../libxlsxconv/include/sheet_selector.hpp"
#include "../../libxlsxconv/include/xlsxconv.hpp"

using namespace xlsxconv;

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return;
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

// append-only log view: one line per reported message, in order
static void append_to_log(const std::string& message) {
    std::cout << message << std::endl;
}

int main(int argc, char* argv[]) {

    CLI::App app{"xlsxconv: convert XLSX workbooks to CSV files."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << "Parse error: " << e.what() << std::endl;
        return app.exit(e);
    }

    Logger::clear_sinks();
    if (const auto level = Logger::string_to_level(settings.log_level)) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = *level;
        Logger::add_sink(std::move(consoleSink));
    }
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file);
        if (!fileSink->is_open()) {
            std::cerr << "Warning: cannot open log file " << settings.log_file.string() << std::endl;
        } else {
            Logger::add_sink(std::move(fileSink));
        }
    }

    init_utf8_locale();

    const SheetSelector sheet = parse_sheet_selector(settings.sheet);
    Logger::log(LogLevel::Debug,
                std::string("Sheet selector: ") + (sheet.is_index() ? "index " : "name ") + sheet.to_string(),
                "main");

    MessageQueue messages;
    Converter converter;
    converter.outputDirectory(settings.output_dir)
             .sheet(sheet)
             .encoding(settings.encoding);
    converter.setReporter(&messages);

    ConversionSummary summary;
    try {
        auto pending = converter.convertAsync(settings.input);

        // the main thread owns the console, the worker only enqueues
        while (pending.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
            if (auto msg = messages.pop(std::chrono::milliseconds(100))) {
                append_to_log(*msg);
            }
        }
        while (auto msg = messages.try_pop()) {
            append_to_log(*msg);
        }

        summary = pending.get();
        append_to_log("All work completed.");
    } catch (const std::exception& e) {
        while (auto msg = messages.try_pop()) {
            append_to_log(*msg);
        }
        append_to_log(std::string("Unexpected error: ") + e.what());
        Logger::log(LogLevel::Error, std::string("Unexpected error: ") + e.what(), "main");
        return 2;
    }

    if (!settings.quiet) {
        print_console_report(summary);
    }

    if (!settings.report_path.empty()) {
        if (!export_csv_report(summary, settings.report_path)) {
            Logger::log(LogLevel::Error, "Cannot write report " + settings.report_path.string(), "main");
            std::cerr << "Error: cannot write report " << settings.report_path.string() << std::endl;
        }
    }

    return summary.ok() ? 0 : 1;
}
