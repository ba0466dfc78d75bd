/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade used by libxlsxconv and its hosts.
 */

#ifndef XLSXCONV_LOGGER_HPP
#define XLSXCONV_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for xlsxconv.
 *
 * Delegates every message to all registered ILogSink implementations.
 * A sink that throws is ignored for that message, so logging never
 * interrupts a conversion.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Number of currently registered sinks.
     */
    static std::size_t sink_count();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "xlsxconv").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "xlsxconv") noexcept;

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parses a level name as accepted by --log-level.
     *
     * Case-insensitive. "WARN" and "WARNING" both map to Warning.
     * @return std::nullopt for "NONE" or an unknown name.
     */
    static std::optional<LogLevel> string_to_level(std::string level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

#endif // XLSXCONV_LOGGER_HPP
