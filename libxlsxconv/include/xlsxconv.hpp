/**
 * @file xlsxconv.hpp
 * @brief Public API for the xlsxconv library.
 */

#ifndef XLSXCONV_HPP
#define XLSXCONV_HPP

#include "conversion_result.hpp"
#include "reporter.hpp"
#include "sheet_selector.hpp"

#include <filesystem>
#include <future>
#include <memory>
#include <string>

namespace xlsxconv {

/**
 * @brief Main interface for the xlsxconv library.
 *
 * @details Wraps discovery, per-file conversion and background execution
 * behind a small fluent API. Uses PIMPL to keep OpenXLSX and iconv out of
 * client headers.
 *
 * @code
 * xlsxconv::Converter conv;
 * conv.outputDirectory("out").sheet(xlsxconv::parse_sheet_selector("Data"));
 * const auto summary = conv.convert("workbooks/");
 * @endcode
 */
class Converter {
public:
    Converter();
    ~Converter();

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;
    Converter(Converter&&) noexcept;
    Converter& operator=(Converter&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Sheet read from every workbook.
     * Default: index 0.
     */
    Converter& sheet(SheetSelector selector);

    /**
     * @brief Output text encoding. A blank name means "utf-8".
     * Default: "utf-8".
     */
    Converter& encoding(const std::string& name);

    /**
     * @brief Directory that receives the CSV files. Required.
     */
    Converter& outputDirectory(const std::filesystem::path& dir);

    // --- Observability ---

    /**
     * @brief Sets the reporter for progress messages.
     * The caller retains ownership. Without one, messages go to the Logger.
     */
    void setReporter(ConversionReporter* reporter);

    // --- Execution ---

    /**
     * @brief Converts a workbook or every workbook below a directory. Blocks.
     */
    ConversionSummary convert(const std::filesystem::path& input);

    /**
     * @brief Same as convert(), on the background worker.
     *
     * Runs are queued and never overlap. Configuration is captured at call
     * time; the reporter must stay alive until the future is ready.
     */
    std::future<ConversionSummary> convertAsync(const std::filesystem::path& input);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xlsxconv

#endif // XLSXCONV_HPP
