/**
 * @file workbook_reader.hpp
 * @brief Loads one sheet of an XLSX workbook into a SheetTable.
 */

#ifndef XLSXCONV_WORKBOOK_READER_HPP
#define XLSXCONV_WORKBOOK_READER_HPP

#include "sheet_selector.hpp"
#include "sheet_table.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace xlsxconv {

/**
 * @brief Reads sheets through OpenXLSX.
 *
 * @details The first row of the sheet becomes the header; an empty header
 * cell is named "Unnamed: <column>" and a repeated name gets a ".1", ".2"
 * suffix. Trailing rows with no values are dropped, empty rows inside the
 * data are kept. Numbers whose cell format is a date or time format are
 * written as timestamps.
 */
class WorkbookReader {
public:
    /**
     * @brief Load the selected sheet. A negative index counts from the last sheet.
     * @throws SheetNotFoundError if the index is out of range or the name is unknown.
     * @throws WorkbookError if the file cannot be opened as a workbook.
     */
    [[nodiscard]] SheetTable load(const std::filesystem::path& path,
                                  const SheetSelector& selector) const;
};

/**
 * @brief Formats a floating point cell value the way it is written to CSV.
 *
 * Shortest text that reads back to the same double; integral values keep a
 * trailing ".0" so they stay distinguishable from integer cells.
 */
std::string format_float(double value);

/**
 * @brief Formats an Excel date serial (1900 date system).
 *
 * "2024-01-15" at midnight, "2024-01-15 13:30:00" otherwise, fractional
 * seconds only when present. With @p time_only a serial below one day is
 * written as "13:30:00".
 */
std::string format_excel_serial(double serial, bool time_only = false);

/**
 * @brief True if a custom number format code shows a date or time.
 */
bool is_date_format_code(std::string_view code);

} // namespace xlsxconv

#endif // XLSXCONV_WORKBOOK_READER_HPP
