#pragma once

#include "mcprelay/sdk/constants.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace mcprelay {
namespace sdk {

/**
 * @brief Fixed-size FIFO worker pool
 *
 * The bridge runs forwarded requests here so a slow downstream call never
 * blocks the connection's I/O thread. Exceptions thrown by a task are stored
 * in the returned future.
 */
class ThreadPool {
public:
    explicit ThreadPool(std::size_t thread_count = constants::DEFAULT_WORKER_THREADS,
                        std::string name = "worker");

    // Drains queued tasks, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<decltype(f(args...))> {
        using return_type = decltype(f(args...));

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            if (!running_) {
                throw std::runtime_error("Cannot enqueue on stopped ThreadPool");
            }

            tasks_.emplace_back([task]() { (*task)(); });
        }

        condition_.notify_one();
        return result;
    }

    std::size_t get_queued_tasks() const;
    std::size_t get_active_tasks() const;
    std::size_t get_completed_tasks() const;
    std::size_t get_thread_count() const;

private:
    void worker_loop();

    std::string name_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool running_ = false;
    std::atomic<std::size_t> active_tasks_{0};
    std::atomic<std::size_t> completed_tasks_{0};
};

} // namespace sdk
} // namespace mcprelay
