#ifndef XLSXCONV_CONSOLE_LOG_SINK_HPP
#define XLSXCONV_CONSOLE_LOG_SINK_HPP

#include "../../../libxlsxconv/include/log_sink.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Diagnostics on stderr, at or above a threshold.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case LogLevel::Debug:
                std::cerr << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cerr << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // XLSXCONV_CONSOLE_LOG_SINK_HPP
