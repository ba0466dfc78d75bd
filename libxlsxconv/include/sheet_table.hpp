#ifndef XLSXCONV_SHEET_TABLE_HPP
#define XLSXCONV_SHEET_TABLE_HPP

#include <string>
#include <vector>

namespace xlsxconv {

/**
 * @brief Text content of one sheet: column names plus data rows.
 *
 * Every row has exactly header.size() fields.
 */
struct SheetTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    [[nodiscard]] std::size_t column_count() const { return header.size(); }
    [[nodiscard]] std::size_t row_count() const { return rows.size(); }
};

} // namespace xlsxconv

#endif // XLSXCONV_SHEET_TABLE_HPP
