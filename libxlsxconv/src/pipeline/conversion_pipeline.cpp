#include "../../include/conversion_pipeline.hpp"
#include "../../include/csv_writer.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_discoverer.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"

#include <chrono>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace xlsxconv {

namespace {

void emit(ConversionReporter& reporter, const std::string& message) noexcept {
    try {
        reporter.report(message);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning,
                    std::string("Reporter failed: ") + e.what() + " (message: " + message + ")",
                    "pipeline");
    } catch (...) {
        Logger::log(LogLevel::Warning, "Reporter failed with a non-standard exception (message: " + message + ")",
                    "pipeline");
    }
}

fs::path absolute_or_same(const fs::path& p) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    return ec ? p : abs;
}

// error text plus, for load failures, what the file actually looks like
std::string load_failure_detail(const fs::path& source, const std::exception& e) {
    std::string detail = e.what();
    if (dynamic_cast<const SheetNotFoundError*>(&e) != nullptr) {
        return detail;
    }
    const auto mime = MimeDetector::detect(source);
    if (!mime.empty() && !MimeDetector::looks_like_workbook(mime)) {
        detail += " [detected type: " + mime + "]";
    }
    return detail;
}

} // namespace

ConversionPipeline::ConversionPipeline(Discoverer discoverer)
    : discoverer_(std::move(discoverer)) {
    if (!discoverer_) {
        discoverer_ = discover_default();
    }
}

ConversionPipeline::Discoverer ConversionPipeline::discover_default() {
    return [](const fs::path& p) { return discover_workbooks(p); };
}

fs::path ConversionPipeline::output_path_for(const fs::path& source, const fs::path& output_dir) {
    fs::path name = source.stem();
    name += kTextExtension;
    return output_dir / name;
}

ConversionSummary ConversionPipeline::run(const ConversionRequest& request,
                                          ConversionReporter& reporter) const {
    const auto start = std::chrono::steady_clock::now();
    ConversionSummary summary;
    auto finish = [&](const RunStatus status) {
        summary.status = status;
        summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        Logger::log(LogLevel::Info,
                    std::string("Run ended: ") + to_string(status) + ", " +
                    std::to_string(summary.converted()) + " converted, " +
                    std::to_string(summary.skipped()) + " skipped, " +
                    std::to_string(summary.failed()) + " failed",
                    "pipeline");
        return summary;
    };

    // --- Setup ---
    std::error_code ec;
    if (!fs::exists(request.input_path, ec)) {
        emit(reporter, "Error: input path '" + request.input_path.string() + "' does not exist.");
        return finish(RunStatus::InputMissing);
    }

    if (!fs::exists(request.output_dir, ec)) {
        fs::create_directories(request.output_dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                        "Failed to create output directory: " + request.output_dir.string() + " (" + ec.message() + ")",
                        "pipeline");
            emit(reporter, "Failed to create output directory '" + request.output_dir.string() + "': " + ec.message());
            return finish(RunStatus::OutputDirFailed);
        }
        emit(reporter, "Created output directory: " + request.output_dir.string());
    } else if (!fs::is_directory(request.output_dir, ec)) {
        emit(reporter, "Failed to create output directory '" + request.output_dir.string() +
                       "': a file with that name already exists");
        return finish(RunStatus::OutputDirFailed);
    }

    // --- Discovery ---
    const auto sources = discoverer_(request.input_path);
    if (sources.empty()) {
        emit(reporter, "No .xlsx files found to convert.");
        return finish(RunStatus::NothingToConvert);
    }

    emit(reporter, "--- Starting conversion (" + std::to_string(sources.size()) + " files) ---\n"
                   "Input path: " + absolute_or_same(request.input_path).string() + "\n"
                   "Output directory: " + absolute_or_same(request.output_dir).string());

    // --- Conversion ---
    summary.files.reserve(sources.size());
    for (const auto& source : sources) {
        summary.files.push_back(convert_file(source, request, reporter));
    }

    emit(reporter, "--- Conversion finished ---");
    return finish(RunStatus::Completed);
}

FileResult ConversionPipeline::convert_file(const fs::path& source,
                                            const ConversionRequest& request,
                                            ConversionReporter& reporter) const {
    FileResult result;
    result.source = source;

    std::error_code ec;
    if (!fs::exists(source, ec)) {
        result.status = FileStatus::Skipped;
        result.error = "file no longer exists";
        Logger::log(LogLevel::Warning, "Vanished before conversion: " + source.string(), "pipeline");
        emit(reporter, "Error: input file '" + source.string() + "' no longer exists. Skipping.");
        return result;
    }

    SheetTable table;
    try {
        table = reader_.load(source, request.sheet);
    } catch (const std::exception& e) {
        result.error = load_failure_detail(source, e);
        Logger::log(LogLevel::Error, source.string() + ": " + result.error, "pipeline");
        emit(reporter, "Conversion error (" + source.string() + "): " + result.error);
        return result;
    }

    emit(reporter, "Read sheet '" + request.sheet.to_string() + "' from '" + source.string() +
                   "' (" + std::to_string(table.row_count()) + " rows)");

    try {
        const auto out_path = output_path_for(source, request.output_dir);
        write_csv(table, out_path, request.encoding);
        result.output = out_path;
    } catch (const std::exception& e) {
        result.error = e.what();
        Logger::log(LogLevel::Error, source.string() + ": " + result.error, "pipeline");
        emit(reporter, "Conversion error (" + source.string() + "): " + result.error);
        return result;
    }

    result.status = FileStatus::Converted;
    result.rows = table.row_count();
    Logger::log(LogLevel::Info, "Converted " + source.string() + " -> " + result.output.string(), "pipeline");
    emit(reporter, "Saved: " + result.output.string());
    return result;
}

} // namespace xlsxconv
