#include "../../include/conversion_result.hpp"

#include <algorithm>

namespace xlsxconv {

std::size_t ConversionSummary::count(const FileStatus s) const {
    return static_cast<std::size_t>(
        std::ranges::count_if(files, [s](const FileResult& f) { return f.status == s; }));
}

bool ConversionSummary::ok() const {
    if (status == RunStatus::InputMissing || status == RunStatus::OutputDirFailed) return false;
    return failed() == 0;
}

const char* to_string(const FileStatus status) {
    switch (status) {
        case FileStatus::Converted: return "converted";
        case FileStatus::Skipped:   return "skipped";
        case FileStatus::Failed:    return "failed";
    }
    return "";
}

const char* to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Completed:        return "completed";
        case RunStatus::NothingToConvert: return "nothing to convert";
        case RunStatus::InputMissing:     return "input missing";
        case RunStatus::OutputDirFailed:  return "output directory failed";
    }
    return "";
}

} // namespace xlsxconv
