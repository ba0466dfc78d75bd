#include "report_generator.hpp"
#include "../../../libxlsxconv/include/csv_writer.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

using xlsxconv::ConversionSummary;
using xlsxconv::FileResult;
using xlsxconv::FileStatus;

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

static std::string detail_of(const FileResult& r) {
    return r.status == FileStatus::Converted ? r.output.string() : r.error;
}

// keep the end of long paths, that is where the file name is
static std::string fit(const std::string& s, const size_t width) {
    if (s.size() <= width) return s;
    if (width <= 3) return s.substr(s.size() - width);
    return "..." + s.substr(s.size() - (width - 3));
}

void print_console_report(const ConversionSummary& summary) {
    if (summary.files.empty()) return;

    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    constexpr size_t status_width = 11;
    constexpr size_t rows_width = 8;
    size_t file_width = 20;
    for (const auto& r : summary.files) {
        file_width = std::max(file_width, r.source.filename().string().size() + 2);
    }
    file_width = std::min<size_t>(file_width, 40);
    const size_t fixed = file_width + status_width + rows_width;
    const size_t detail_width = term_width > fixed + 10 ? term_width - fixed : 30;

    std::cerr << "\n" << std::left
              << std::setw(static_cast<int>(file_width)) << "File"
              << std::setw(static_cast<int>(status_width)) << "Status"
              << std::setw(static_cast<int>(rows_width)) << "Rows"
              << "Output / Error" << "\n";

    for (const auto& r : summary.files) {
        std::string status = to_string(r.status);
        std::string colored = status;
        if (use_colors) {
            switch (r.status) {
                case FileStatus::Converted: colored = "\033[1;32m" + status + "\033[0m"; break;
                case FileStatus::Skipped:   colored = "\033[1;33m" + status + "\033[0m"; break;
                case FileStatus::Failed:    colored = "\033[1;31m" + status + "\033[0m"; break;
            }
        }
        // setw counts escape codes, pad by hand
        const std::string pad(status_width > status.size() ? status_width - status.size() : 1, ' ');
        const std::string rows = r.status == FileStatus::Converted ? std::to_string(r.rows) : "-";

        std::string detail = detail_of(r);
        std::replace(detail.begin(), detail.end(), '\n', ' ');

        std::cerr << std::setw(static_cast<int>(file_width)) << fit(r.source.filename().string(), file_width - 2)
                  << colored << pad
                  << std::setw(static_cast<int>(rows_width)) << rows
                  << fit(detail, detail_width) << "\n";
    }

    std::cerr << "\nConverted: " << summary.converted()
              << "  Skipped: " << summary.skipped()
              << "  Failed: " << summary.failed() << "\n";
    std::cerr << "Total time: " << std::fixed << std::setprecision(2)
              << static_cast<double>(summary.duration.count()) / 1000.0 << " s\n";
}

bool export_csv_report(const ConversionSummary& summary,
                       const std::filesystem::path& output_path) {
    using xlsxconv::csv_escape;

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out) return false;

    out << "File,Status,Rows,Output,Error\n";
    for (const auto& r : summary.files) {
        out << csv_escape(r.source.string()) << ","
            << to_string(r.status) << ","
            << (r.status == FileStatus::Converted ? std::to_string(r.rows) : "") << ","
            << csv_escape(r.output.string()) << ","
            << csv_escape(r.error) << "\n";
    }

    std::ostringstream secs;
    secs << std::fixed << std::setprecision(2) << static_cast<double>(summary.duration.count()) / 1000.0;

    out << "\n\nRun status,Converted,Skipped,Failed,Time(s)\n";
    out << csv_escape(to_string(summary.status)) << ","
        << summary.converted() << ","
        << summary.skipped() << ","
        << summary.failed() << ","
        << secs.str() << "\n";

    out.flush();
    return static_cast<bool>(out);
}
