/**
 * @file reporter.hpp
 * @brief Channel through which a conversion run describes what it does.
 */

#ifndef XLSXCONV_REPORTER_HPP
#define XLSXCONV_REPORTER_HPP

#include "logger.hpp"

#include <functional>
#include <string>
#include <utility>

namespace xlsxconv {

/**
 * @brief Receives human-readable progress and error lines.
 *
 * @details Called on the thread that runs the pipeline, which for an
 * interactive host is a background worker. Implementations that touch UI
 * state must hand the message over to the UI thread themselves.
 * Exceptions thrown from report() are caught and logged by the pipeline.
 */
struct ConversionReporter {
    virtual ~ConversionReporter() = default;

    virtual void report(const std::string& message) = 0;
};

/**
 * @brief Adapts a plain callable.
 */
class CallbackReporter final : public ConversionReporter {
public:
    using Callback = std::function<void(const std::string&)>;

    explicit CallbackReporter(Callback cb) : cb_(std::move(cb)) {}

    void report(const std::string& message) override {
        if (cb_) cb_(message);
    }

private:
    Callback cb_;
};

/**
 * @brief Forwards every message to the Logger at Info level.
 * Used when a host does not install a reporter of its own.
 */
class LoggerReporter final : public ConversionReporter {
public:
    void report(const std::string& message) override {
        Logger::log(LogLevel::Info, message, "report");
    }
};

} // namespace xlsxconv

#endif // XLSXCONV_REPORTER_HPP
