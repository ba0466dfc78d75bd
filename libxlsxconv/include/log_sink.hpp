#ifndef XLSXCONV_LOG_SINK_HPP
#define XLSXCONV_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for diagnostic log messages.
 *
 * Conversion progress is not logged through these levels; it goes to the
 * ConversionReporter. The Logger carries diagnostics and the fallback
 * channel for reporter failures.
 */
enum class LogLevel {
    Debug,   ///< Per-cell and per-entry detail, useful for developers
    Info,    ///< Normal operation (discovery counts, files written)
    Warning, ///< Recoverable problems (walk errors, reporter failures)
    Error    ///< Per-file failures and setup failures
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a message ends up (console, file, a test
 * buffer). Sinks may be called from the conversion worker thread.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver one message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "pipeline").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // XLSXCONV_LOG_SINK_HPP
