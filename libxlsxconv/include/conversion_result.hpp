#ifndef XLSXCONV_CONVERSION_RESULT_HPP
#define XLSXCONV_CONVERSION_RESULT_HPP

#include "sheet_selector.hpp"
#include "text_encoder.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace xlsxconv {

/**
 * @brief Parameters of one conversion run, as collected by the host.
 */
struct ConversionRequest {
    std::filesystem::path input_path;            ///< Workbook file or directory root
    std::filesystem::path output_dir;            ///< Created if missing, shared by all outputs
    SheetSelector sheet;                         ///< Sheet read from every workbook
    std::string encoding{kDefaultEncoding};      ///< Output text encoding
};

/**
 * @brief What happened to one discovered workbook.
 */
enum class FileStatus {
    Converted, ///< CSV written
    Skipped,   ///< Source vanished between discovery and conversion
    Failed     ///< Load or write error, see FileResult::error
};

struct FileResult {
    std::filesystem::path source;   ///< Discovered workbook
    FileStatus status = FileStatus::Failed;
    std::filesystem::path output;   ///< Written CSV (Converted only)
    std::size_t rows = 0;           ///< Data rows, header excluded (Converted only)
    std::string error;              ///< Diagnostic detail (Skipped/Failed)
};

/**
 * @brief How the run as a whole ended.
 */
enum class RunStatus {
    Completed,        ///< Every discovered file was attempted
    NothingToConvert, ///< Discovery found no workbook
    InputMissing,     ///< Input path does not exist, nothing done
    OutputDirFailed   ///< Output directory could not be created, nothing converted
};

/**
 * @brief Structured counterpart of the messages a run reports.
 */
struct ConversionSummary {
    RunStatus status = RunStatus::Completed;
    std::vector<FileResult> files;          ///< In processing order
    std::chrono::milliseconds duration{0};

    [[nodiscard]] std::size_t count(FileStatus s) const;
    [[nodiscard]] std::size_t converted() const { return count(FileStatus::Converted); }
    [[nodiscard]] std::size_t skipped() const { return count(FileStatus::Skipped); }
    [[nodiscard]] std::size_t failed() const { return count(FileStatus::Failed); }

    /// True when the run was not aborted and no file failed.
    [[nodiscard]] bool ok() const;
};

const char* to_string(FileStatus status);
const char* to_string(RunStatus status);

} // namespace xlsxconv

#endif // XLSXCONV_CONVERSION_RESULT_HPP
