/**
 * @file file_discoverer.hpp
 * @brief Locates the workbooks a conversion run will process.
 */

#ifndef XLSXCONV_FILE_DISCOVERER_HPP
#define XLSXCONV_FILE_DISCOVERER_HPP

#include <filesystem>
#include <string_view>
#include <vector>

namespace xlsxconv {

/// Qualifying source extension, compared case-insensitively.
inline constexpr std::string_view kWorkbookExtension = ".xlsx";

/// Extension of every written file.
inline constexpr std::string_view kTextExtension = ".csv";

/**
 * @brief True if the file name ends with ".xlsx", in any letter case.
 */
bool has_workbook_extension(const std::filesystem::path& path);

/**
 * @brief Builds the ordered set of workbooks below a path.
 *
 * @details If @p path is an existing regular file the result holds its
 * absolute path when the name qualifies and is empty otherwise. Any other
 * path is walked recursively as a directory, and every qualifying regular
 * file is appended in walk order as `path / relative`. Directory symlinks
 * are not followed.
 *
 * Never throws: a missing root or an unreadable subdirectory yields an
 * empty or partial result plus a warning in the log.
 */
std::vector<std::filesystem::path> discover_workbooks(const std::filesystem::path& path);

} // namespace xlsxconv

#endif // XLSXCONV_FILE_DISCOVERER_HPP
