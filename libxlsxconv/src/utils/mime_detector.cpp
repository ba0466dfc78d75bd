#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/file_discoverer.hpp"
#include "../../include/logger.hpp"

namespace {
constexpr const char* kXlsxMime = "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
}

std::string xlsxconv::MimeDetector::detect(const std::filesystem::path& path)
{
#ifndef _WIN32
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        const char* err = magic_error(magic);
        Logger::log(LogLevel::Debug, std::string("magic_load failed: ") + (err ? err : "unknown"), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
#else
    return has_workbook_extension(path) ? kXlsxMime : "application/octet-stream";
#endif
}

bool xlsxconv::MimeDetector::looks_like_workbook(const std::string& mime)
{
    return mime == kXlsxMime || mime == "application/zip";
}
