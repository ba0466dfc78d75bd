#include "../../include/csv_writer.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_encoder.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace xlsxconv {

namespace {
void append_line(std::string& out, const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i != 0) out.push_back(',');
        out += csv_escape(fields[i]);
    }
    out.push_back('\n');
}
} // namespace

std::string csv_escape(const std::string_view field) {
    if (field.find_first_of(",\"\n\r") == std::string_view::npos) {
        return std::string(field);
    }
    std::string result;
    result.reserve(field.size() + 4);
    result.push_back('"');
    for (const char c : field) {
        if (c == '"') {
            result.push_back('"');
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

std::string to_csv(const SheetTable& table) {
    std::string out;
    append_line(out, table.header);
    for (const auto& row : table.rows) {
        append_line(out, row);
    }
    return out;
}

void write_csv(const SheetTable& table,
               const std::filesystem::path& path,
               const std::string& encoding) {
    const TextEncoder encoder(encoding);
    const std::string bytes = encoder.encode(to_csv(table));

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open " + path.string() + " for writing: " + std::strerror(errno));
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        throw std::runtime_error("write to " + path.string() + " failed: " + std::strerror(errno));
    }

    Logger::log(LogLevel::Debug,
                "Wrote " + std::to_string(bytes.size()) + " bytes (" + encoder.name() + ") to " + path.string(),
                "writer");
}

} // namespace xlsxconv
