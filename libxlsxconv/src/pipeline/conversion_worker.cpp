#include "../../include/conversion_worker.hpp"
#include "../../include/logger.hpp"

#include <memory>
#include <stdexcept>

namespace xlsxconv {

ConversionWorker::ConversionWorker(ConversionPipeline pipeline)
    : pipeline_(std::move(pipeline)),
      thread_([this](const std::stop_token& st) { loop(st); }) {}

ConversionWorker::~ConversionWorker() {
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    // jthread joins on destruction; loop() exits once the queue is empty
}

std::future<ConversionSummary> ConversionWorker::submit(ConversionRequest request,
                                                        ConversionReporter& reporter) {
    auto task = std::make_shared<std::packaged_task<ConversionSummary()>>(
        [this, request = std::move(request), &reporter] {
            return pipeline_.run(request, reporter);
        });
    {
        std::unique_lock lock(queue_mutex_);
        if (stop_) throw std::runtime_error("submit on stopped ConversionWorker");
        ++pending_;
        tasks_.emplace([task] { (*task)(); });
    }
    condition_.notify_one();
    return task->get_future();
}

void ConversionWorker::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return pending_ == 0 && tasks_.empty();
    });
}

void ConversionWorker::loop(const std::stop_token& st) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            condition_.wait(lock, st, [this] {
                return stop_ || !tasks_.empty();
            });
            if (tasks_.empty()) {
                if (stop_ || st.stop_requested()) return;
                continue;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        struct PendingGuard {
            size_t &pending;
            std::mutex &mtx;
            std::condition_variable &cv;
            ~PendingGuard() {
                std::lock_guard lock(mtx);
                if (pending > 0) --pending;
                cv.notify_all();
            }
        } guard{pending_, queue_mutex_, idle_cv_};

        Logger::log(LogLevel::Debug, "Starting queued conversion", "worker");
        // packaged_task stores any exception in the future
        task();
    }
}

} // namespace xlsxconv
