/**
 * @file csv_writer.hpp
 * @brief Serializes a SheetTable as comma separated text.
 */

#ifndef XLSXCONV_CSV_WRITER_HPP
#define XLSXCONV_CSV_WRITER_HPP

#include "sheet_table.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace xlsxconv {

/**
 * @brief Quote a field only when it holds a comma, a quote, CR or LF.
 * Embedded quotes are doubled.
 */
std::string csv_escape(std::string_view field);

/**
 * @brief Render the table as UTF-8 CSV: header line, then one line per row.
 * Lines end with '\n'. No row-index column is written.
 */
std::string to_csv(const SheetTable& table);

/**
 * @brief Write the table to @p path in @p encoding, replacing any existing file.
 *
 * The whole document is encoded before the file is opened, so an encoding
 * failure leaves the destination untouched.
 *
 * @throws EncodingError on an unknown encoding or unrepresentable text.
 * @throws std::runtime_error if the file cannot be opened or written.
 */
void write_csv(const SheetTable& table,
               const std::filesystem::path& path,
               const std::string& encoding);

} // namespace xlsxconv

#endif // XLSXCONV_CSV_WRITER_HPP
