#ifndef XLSXCONV_MIME_DETECTOR_HPP
#define XLSXCONV_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace xlsxconv {

    /**
     * @brief Content-based file type detection for failure diagnostics.
     *
     * When a workbook cannot be loaded, the pipeline adds the detected
     * type to the reported error so a renamed CSV or a truncated download
     * is easy to tell apart from a damaged workbook.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @return e.g. "application/zip", or an empty string if detection failed.
         *
         * @note On Linux/macOS this uses libmagic. On Windows it falls back
         * to the file extension.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief True for the types an XLSX file is reported as (the OOXML
         * spreadsheet type or plain zip).
         */
        static bool looks_like_workbook(const std::string& mime);
    };

} // namespace xlsxconv

#endif //XLSXCONV_MIME_DETECTOR_HPP
