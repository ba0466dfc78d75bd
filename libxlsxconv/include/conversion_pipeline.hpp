/**
 * @file conversion_pipeline.hpp
 * @brief Orchestrates one conversion run over a set of workbooks.
 */

#ifndef XLSXCONV_CONVERSION_PIPELINE_HPP
#define XLSXCONV_CONVERSION_PIPELINE_HPP

#include "conversion_result.hpp"
#include "reporter.hpp"
#include "workbook_reader.hpp"

#include <filesystem>
#include <functional>
#include <vector>

namespace xlsxconv {

/**
 * @brief Synchronous, sequential XLSX to CSV conversion.
 *
 * @details A run has three phases:
 * - Setup: the input must exist and the output directory must exist or be
 *   creatable. A failure here is reported once and ends the run.
 * - Discovery: the input is expanded to the workbooks to convert.
 * - Conversion: each workbook is loaded, serialized and written on its
 *   own. A failing file is reported and recorded, then the next one
 *   starts.
 *
 * run() does not throw for anything a single file can cause. Every
 * reporter call is guarded; a throwing reporter only produces a log line.
 */
class ConversionPipeline {
public:
    using Discoverer = std::function<std::vector<std::filesystem::path>(const std::filesystem::path&)>;

    /**
     * @param discoverer Expands the input path, discover_workbooks by default.
     */
    explicit ConversionPipeline(Discoverer discoverer = discover_default());

    /**
     * @brief Run a full conversion. Blocks until every file was attempted.
     */
    ConversionSummary run(const ConversionRequest& request, ConversionReporter& reporter) const;

    /**
     * @brief `output_dir / (stem + ".csv")`, whatever the case of the source extension.
     */
    static std::filesystem::path output_path_for(const std::filesystem::path& source,
                                                 const std::filesystem::path& output_dir);

private:
    static Discoverer discover_default();

    FileResult convert_file(const std::filesystem::path& source,
                            const ConversionRequest& request,
                            ConversionReporter& reporter) const;

    Discoverer discoverer_;
    WorkbookReader reader_;
};

} // namespace xlsxconv

#endif // XLSXCONV_CONVERSION_PIPELINE_HPP
