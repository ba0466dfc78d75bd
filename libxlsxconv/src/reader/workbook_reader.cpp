#include "../../include/workbook_reader.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

#include <OpenXLSX.hpp>

#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <unordered_map>

namespace fs = std::filesystem;

namespace xlsxconv {

namespace {

// closes the document on every exit path
struct DocumentGuard {
    OpenXLSX::XLDocument& doc;
    ~DocumentGuard() {
        try {
            doc.close();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning, std::string("Closing workbook failed: ") + e.what(), "reader");
        }
    }
};

void open_document(OpenXLSX::XLDocument& doc, const fs::path& path) {
    try {
        doc.open(path.string());
    } catch (const std::exception& e) {
        throw WorkbookError("cannot open workbook " + path.string() + ": " + e.what());
    }
}

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += "'" + n + "'";
    }
    return out;
}

std::string resolve_sheet_name(const std::vector<std::string>& names,
                               const SheetSelector& selector,
                               const fs::path& path) {
    if (selector.is_index()) {
        const int idx = selector.as_index();
        // negative indexes count from the last sheet
        const auto count = static_cast<long long>(names.size());
        const long long pos = idx < 0 ? idx + count : idx;
        if (pos < 0 || pos >= count) {
            throw SheetNotFoundError("sheet index " + std::to_string(idx) + " is out of range for " +
                                     path.string() + " (" + std::to_string(names.size()) + " sheet(s))");
        }
        return names[static_cast<std::size_t>(pos)];
    }

    for (const auto& n : names) {
        if (n == selector.as_name()) return n;
    }
    throw SheetNotFoundError("worksheet named '" + selector.as_name() + "' not found in " +
                             path.string() + " (available: " + join_names(names) + ")");
}

enum class DateKind { None, Date, Time };

DateKind builtin_date_kind(const uint32_t id) {
    if ((id >= 14 && id <= 17) || id == 22) return DateKind::Date;
    if ((id >= 18 && id <= 21) || (id >= 45 && id <= 47)) return DateKind::Time;
    return DateKind::None;
}

DateKind custom_date_kind(const std::string_view code) {
    if (!is_date_format_code(code)) return DateKind::None;
    for (const char c : code) {
        const auto lc = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lc == 'y' || lc == 'd') return DateKind::Date;
    }
    for (const char c : code) {
        const auto lc = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lc == 'h' || lc == 's') return DateKind::Time;
    }
    return DateKind::Date;
}

// date kind of every cell format in a workbook, indexed like cellFormats()
class DateStyles {
public:
    explicit DateStyles(OpenXLSX::XLDocument& doc) {
        try {
            auto& styles = doc.styles();

            std::unordered_map<uint32_t, DateKind> custom;
            auto& numFmts = styles.numberFormats();
            for (std::size_t i = 0; i < numFmts.count(); ++i) {
                const auto& fmt = numFmts[i];
                custom[fmt.numberFormatId()] = custom_date_kind(fmt.formatCode());
            }

            auto& cellFmts = styles.cellFormats();
            kinds_.reserve(cellFmts.count());
            for (std::size_t i = 0; i < cellFmts.count(); ++i) {
                const uint32_t id = cellFmts[i].numberFormatId();
                const auto it = custom.find(id);
                kinds_.push_back(it != custom.end() ? it->second : builtin_date_kind(id));
            }
        } catch (const std::exception& e) {
            kinds_.clear();
            Logger::log(LogLevel::Warning,
                        std::string("Cell styles unreadable, dates stay numeric: ") + e.what(), "reader");
        }
    }

    [[nodiscard]] DateKind kind(const OpenXLSX::XLCell& cell) const {
        const auto idx = static_cast<std::size_t>(cell.cellFormat());
        return idx < kinds_.size() ? kinds_[idx] : DateKind::None;
    }

private:
    std::vector<DateKind> kinds_;
};

std::string cell_to_string(const OpenXLSX::XLCell& cell, const DateStyles& dates) {
    using OpenXLSX::XLValueType;

    const auto& v = cell.value();
    switch (v.type()) {
        case XLValueType::Empty:
            return "";
        case XLValueType::Boolean:
            return v.get<bool>() ? "True" : "False";
        case XLValueType::Integer:
        case XLValueType::Float: {
            const auto kind = dates.kind(cell);
            if (kind != DateKind::None) {
                const double serial = v.type() == XLValueType::Integer
                                          ? static_cast<double>(v.get<int64_t>())
                                          : v.get<double>();
                return format_excel_serial(serial, kind == DateKind::Time);
            }
            if (v.type() == XLValueType::Integer) return std::to_string(v.get<int64_t>());
            return format_float(v.get<double>());
        }
        case XLValueType::String:
            return v.get<std::string>();
        case XLValueType::Error:
            return "#ERROR";
        default:
            break;
    }
    return v.get<std::string>();
}

// repeated names become "a", "a.1", "a.2", skipping names already taken
void dedup_header(std::vector<std::string>& header) {
    std::unordered_map<std::string, int> counts;
    for (auto& name : header) {
        std::string col = name;
        int cur = counts[col];
        while (cur > 0) {
            counts[col] = cur + 1;
            col += "." + std::to_string(cur);
            cur = counts[col];
        }
        counts[col] = cur + 1;
        name = std::move(col);
    }
}

std::vector<std::string> worksheet_names(OpenXLSX::XLDocument& doc, const fs::path& path) {
    try {
        return doc.workbook().worksheetNames();
    } catch (const std::exception& e) {
        throw WorkbookError("cannot list sheets of " + path.string() + ": " + e.what());
    }
}

bool row_is_empty(const std::vector<std::string>& row) {
    for (const auto& field : row) {
        if (!field.empty()) return false;
    }
    return true;
}

} // namespace

std::string format_float(const double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

    std::array<char, 64> buf{};
    const auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    std::string out(buf.data(), ptr);
    if (out.find_first_of(".e") == std::string::npos) {
        out += ".0";
    }
    return out;
}

bool is_date_format_code(const std::string_view code) {
    bool in_quotes = false;
    for (std::size_t i = 0; i < code.size(); ++i) {
        const char c = code[i];
        if (in_quotes) {
            if (c == '"') in_quotes = false;
            continue;
        }
        switch (c) {
            case '"':
                in_quotes = true;
                continue;
            case '\\':
            case '_':
            case '*':
                ++i; // next character is literal, padding or fill
                continue;
            case '[': {
                // [Red], [$-409] are not dates; [h], [mm], [ss] are elapsed time
                const auto close = code.find(']', i);
                if (close == std::string_view::npos) return false;
                const auto inner = code.substr(i + 1, close - i - 1);
                if (!inner.empty() && inner.find_first_not_of("hHmMsS") == std::string_view::npos) {
                    return true;
                }
                i = close;
                continue;
            }
            default:
                break;
        }
        switch (std::tolower(static_cast<unsigned char>(c))) {
            case 'y': case 'm': case 'd': case 'h': case 's':
                return true;
            default:
                break;
        }
    }
    return false;
}

std::string format_excel_serial(const double serial, const bool time_only) {
    constexpr long long kMicrosPerDay = 86'400'000'000LL;
    if (!std::isfinite(serial) || serial < 0 || serial > 2958465.0) {
        return format_float(serial); // outside 1900-01-00 .. 9999-12-31
    }

    const auto micros = std::llround(serial * static_cast<double>(kMicrosPerDay));
    long long serial_day = micros / kMicrosPerDay;
    long long rem = micros % kMicrosPerDay;

    const int hour = static_cast<int>(rem / 3'600'000'000LL);
    rem %= 3'600'000'000LL;
    const int minute = static_cast<int>(rem / 60'000'000LL);
    rem %= 60'000'000LL;
    const int second = static_cast<int>(rem / 1'000'000LL);
    const int micro = static_cast<int>(rem % 1'000'000LL);

    std::array<char, 40> buf{};
    std::string time;
    if (micro != 0) {
        std::snprintf(buf.data(), buf.size(), "%02d:%02d:%02d.%06d", hour, minute, second, micro);
    } else {
        std::snprintf(buf.data(), buf.size(), "%02d:%02d:%02d", hour, minute, second);
    }
    time = buf.data();

    if (time_only && serial_day == 0) {
        return time;
    }

    // serials below 60 predate the phantom 1900-02-29 and need one extra day
    if (micros > 0 && serial_day < 60) ++serial_day;
    using namespace std::chrono;
    const year_month_day ymd{sys_days{year{1899} / December / 30} + days{serial_day}};
    std::snprintf(buf.data(), buf.size(), "%04d-%02u-%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    std::string out = buf.data();

    if (micros % kMicrosPerDay != 0) {
        out += " " + time;
    }
    return out;
}

SheetTable WorkbookReader::load(const fs::path& path, const SheetSelector& selector) const {
    OpenXLSX::XLDocument doc;
    open_document(doc, path);
    DocumentGuard guard{doc};

    const auto names = worksheet_names(doc, path);
    const std::string sheet_name = resolve_sheet_name(names, selector, path);

    SheetTable table;
    try {
        auto ws = doc.workbook().worksheet(sheet_name);
        const DateStyles dates(doc);
        const uint32_t last_row = ws.rowCount();
        const uint16_t last_col = ws.columnCount();
        Logger::log(LogLevel::Debug,
                    "Sheet '" + sheet_name + "' of " + path.string() + ": " +
                    std::to_string(last_row) + " row(s), " + std::to_string(last_col) + " column(s)",
                    "reader");

        if (last_row == 0 || last_col == 0) {
            return table;
        }

        table.header.reserve(last_col);
        for (uint16_t col = 1; col <= last_col; ++col) {
            auto name = cell_to_string(ws.cell(OpenXLSX::XLCellReference(1, col)), dates);
            if (name.empty()) {
                name = "Unnamed: " + std::to_string(col - 1);
            }
            table.header.push_back(std::move(name));
        }
        dedup_header(table.header);

        for (uint32_t row = 2; row <= last_row; ++row) {
            std::vector<std::string> fields;
            fields.reserve(last_col);
            for (uint16_t col = 1; col <= last_col; ++col) {
                fields.push_back(cell_to_string(ws.cell(OpenXLSX::XLCellReference(row, col)), dates));
            }
            table.rows.push_back(std::move(fields));
        }
    } catch (const std::exception& e) {
        throw WorkbookError("cannot read sheet '" + sheet_name + "' of " + path.string() + ": " + e.what());
    }

    while (!table.rows.empty() && row_is_empty(table.rows.back())) {
        table.rows.pop_back();
    }
    return table;
}

} // namespace xlsxconv
