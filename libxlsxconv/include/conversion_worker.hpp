/**
 * @file conversion_worker.hpp
 * @brief Runs conversions off the caller's thread.
 */

#ifndef XLSXCONV_CONVERSION_WORKER_HPP
#define XLSXCONV_CONVERSION_WORKER_HPP

#include "conversion_pipeline.hpp"

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>

namespace xlsxconv {

/**
 * @brief A single background thread that executes conversion runs in order.
 *
 * @details Keeps an interactive host responsive: submit() returns at once
 * and the summary arrives through the future. Jobs never overlap, so a
 * host gets at most one conversion at a time without further locking.
 * A running batch cannot be cancelled; the destructor finishes every
 * queued job before joining.
 */
class ConversionWorker {
public:
    explicit ConversionWorker(ConversionPipeline pipeline = ConversionPipeline{});

    /**
     * @brief Drains the queue and joins the thread.
     */
    ~ConversionWorker();

    ConversionWorker(const ConversionWorker&) = delete;
    ConversionWorker& operator=(const ConversionWorker&) = delete;

    /**
     * @brief Queue a run.
     *
     * The reporter is called on the worker thread and must outlive the job.
     * An exception escaping the pipeline is stored in the future.
     *
     * @throws std::runtime_error if the worker is shutting down.
     */
    std::future<ConversionSummary> submit(ConversionRequest request, ConversionReporter& reporter);

    /**
     * @brief Blocks until no job is queued or running.
     */
    void wait_idle();

    /**
     * @brief Id of the worker thread, for hosts that assert where callbacks run.
     */
    [[nodiscard]] std::thread::id thread_id() const { return thread_.get_id(); }

private:
    void loop(const std::stop_token& st);

    ConversionPipeline pipeline_;
    std::mutex queue_mutex_;                        ///< Protects tasks_, stop_, and pending_
    std::condition_variable_any condition_;         ///< Wakes the worker for new tasks or stop
    std::condition_variable idle_cv_;               ///< Notifies wait_idle() when pending_ is zero
    std::queue<std::function<void()>> tasks_;
    bool stop_{false};
    size_t pending_{0};                             ///< Jobs queued or running
    std::jthread thread_;                           ///< Declared last: starts after the members it uses
};

} // namespace xlsxconv

#endif // XLSXCONV_CONVERSION_WORKER_HPP
