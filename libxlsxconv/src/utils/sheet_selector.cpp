#include "../../include/sheet_selector.hpp"

#include <cctype>
#include <charconv>

namespace xlsxconv {

namespace {
std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}
} // namespace

SheetSelector SheetSelector::index(const int idx) {
    SheetSelector s;
    s.value_ = idx;
    return s;
}

SheetSelector SheetSelector::name(std::string sheet_name) {
    SheetSelector s;
    s.value_ = std::move(sheet_name);
    return s;
}

std::string SheetSelector::to_string() const {
    if (is_index()) return std::to_string(as_index());
    return as_name();
}

SheetSelector parse_sheet_selector(const std::string_view text) {
    const auto trimmed = trim(text);
    if (trimmed.empty()) {
        return SheetSelector::index(0);
    }

    // from_chars rejects a leading '+', strip it by hand
    std::string_view digits = trimmed;
    if (digits.size() > 1 && digits.front() == '+' &&
        std::isdigit(static_cast<unsigned char>(digits[1]))) {
        digits.remove_prefix(1);
    }

    int value = 0;
    const auto* first = digits.data();
    const auto* last = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc() && ptr == last) {
        return SheetSelector::index(value);
    }
    return SheetSelector::name(std::string(trimmed));
}

} // namespace xlsxconv
