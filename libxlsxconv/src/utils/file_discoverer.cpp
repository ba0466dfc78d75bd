#include "../../include/file_discoverer.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace xlsxconv {

bool has_workbook_extension(const fs::path& path) {
    auto name = path.filename().string();
    std::ranges::transform(name, name.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name.ends_with(kWorkbookExtension);
}

std::vector<fs::path> discover_workbooks(const fs::path& path) {
    std::vector<fs::path> result;
    std::error_code ec;

    if (fs::is_regular_file(path, ec)) {
        if (has_workbook_extension(path)) {
            auto abs = fs::absolute(path, ec);
            result.push_back(ec ? path : abs);
        } else {
            Logger::log(LogLevel::Debug, "Not a workbook: " + path.string(), "discoverer");
        }
        return result;
    }

    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::log(LogLevel::Warning,
                    "Cannot walk " + path.string() + " (" + ec.message() + ")",
                    "discoverer");
        return result;
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            Logger::log(LogLevel::Warning,
                        "Directory walk stopped early in " + path.string() + " (" + ec.message() + ")",
                        "discoverer");
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && has_workbook_extension(it->path())) {
            result.push_back(it->path());
        }
    }

    Logger::log(LogLevel::Info,
                "Discovered " + std::to_string(result.size()) + " workbook(s) under " + path.string(),
                "discoverer");
    return result;
}

} // namespace xlsxconv
