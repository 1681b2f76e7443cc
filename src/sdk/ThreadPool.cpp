#include "mcprelay/sdk/ThreadPool.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"

namespace mcprelay {
namespace sdk {

ThreadPool::ThreadPool(std::size_t thread_count, std::string name)
    : name_(std::move(name)) {
    if (thread_count == 0) {
        thread_count = 1;
    }

    running_ = true;
    workers_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }

    SecureLogger::instance().debug("Thread pool '" + name_ + "' started with " +
                                   std::to_string(thread_count) + " threads");
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        running_ = false;
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    SecureLogger::instance().debug("Thread pool '" + name_ + "' shut down after " +
                                   std::to_string(completed_tasks_.load()) + " tasks");
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            condition_.wait(lock, [this] {
                return !tasks_.empty() || !running_;
            });

            // Queued work is drained before the workers exit
            if (tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_tasks_;
        }

        // packaged_task captures the task's own exceptions
        task();

        --active_tasks_;
        ++completed_tasks_;
    }
}

std::size_t ThreadPool::get_queued_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

std::size_t ThreadPool::get_active_tasks() const {
    return active_tasks_;
}

std::size_t ThreadPool::get_completed_tasks() const {
    return completed_tasks_;
}

std::size_t ThreadPool::get_thread_count() const {
    return workers_.size();
}

} // namespace sdk
} // namespace mcprelay
