#ifndef XLSXCONV_REPORT_GENERATOR_HPP
#define XLSXCONV_REPORT_GENERATOR_HPP

#include "../../../libxlsxconv/include/conversion_result.hpp"

#include <filesystem>

/**
 * @brief Print a per-file table and totals to stderr.
 */
void print_console_report(const xlsxconv::ConversionSummary& summary);

/**
 * @brief Export the per-file results and totals as CSV.
 * @return false if the report file could not be written.
 */
bool export_csv_report(const xlsxconv::ConversionSummary& summary,
                       const std::filesystem::path& output_path);

unsigned get_terminal_width();

#endif //XLSXCONV_REPORT_GENERATOR_HPP
