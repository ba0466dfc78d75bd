/**
 * @file sheet_selector.hpp
 * @brief Identifies which sheet of a workbook is converted.
 */

#ifndef XLSXCONV_SHEET_SELECTOR_HPP
#define XLSXCONV_SHEET_SELECTOR_HPP

#include <string>
#include <string_view>
#include <variant>

namespace xlsxconv {

/**
 * @brief Either a zero-based sheet index or a literal sheet name.
 *
 * @details The selector is resolved against every workbook on its own: the
 * same index or name may exist in one file and not in another.
 */
class SheetSelector {
public:
    /// Defaults to the first sheet.
    SheetSelector() = default;

    static SheetSelector index(int idx);
    static SheetSelector name(std::string sheet_name);

    [[nodiscard]] bool is_index() const { return std::holds_alternative<int>(value_); }
    [[nodiscard]] bool is_name() const { return std::holds_alternative<std::string>(value_); }

    /// @pre is_index()
    [[nodiscard]] int as_index() const { return std::get<int>(value_); }
    /// @pre is_name()
    [[nodiscard]] const std::string& as_name() const { return std::get<std::string>(value_); }

    /// Text as shown in log messages: the number or the name.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const SheetSelector&) const = default;

private:
    std::variant<int, std::string> value_{0};
};

/**
 * @brief Parses user input into a selector.
 *
 * Surrounding whitespace is ignored. An empty string selects index 0, a
 * string that is entirely an integer (optional sign) selects that index,
 * anything else is taken as a sheet name.
 */
SheetSelector parse_sheet_selector(std::string_view text);

} // namespace xlsxconv

#endif // XLSXCONV_SHEET_SELECTOR_HPP
