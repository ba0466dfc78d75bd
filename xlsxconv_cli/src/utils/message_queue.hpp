#ifndef XLSXCONV_MESSAGE_QUEUE_HPP
#define XLSXCONV_MESSAGE_QUEUE_HPP

#include "../../../libxlsxconv/include/reporter.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief Hands reporter messages from the conversion worker to the main thread.
 *
 * @details report() only enqueues, so the worker never touches the console
 * directly. The main thread pops messages and appends them to the log in
 * the order they were reported.
 */
class MessageQueue final : public xlsxconv::ConversionReporter {
public:
    void report(const std::string& message) override {
        {
            std::lock_guard lock(mtx_);
            messages_.push_back(message);
        }
        cv_.notify_one();
    }

    /**
     * @brief Wait up to @p timeout for the next message.
     */
    std::optional<std::string> pop(const std::chrono::milliseconds timeout) {
        std::unique_lock lock(mtx_);
        if (!cv_.wait_for(lock, timeout, [this] { return !messages_.empty(); })) {
            return std::nullopt;
        }
        std::string msg = std::move(messages_.front());
        messages_.pop_front();
        return msg;
    }

    /**
     * @brief Next message without waiting.
     */
    std::optional<std::string> try_pop() {
        std::lock_guard lock(mtx_);
        if (messages_.empty()) return std::nullopt;
        std::string msg = std::move(messages_.front());
        messages_.pop_front();
        return msg;
    }

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::string> messages_;
};

#endif // XLSXCONV_MESSAGE_QUEUE_HPP
