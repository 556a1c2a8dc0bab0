/**
 * @file    thread_pool.hpp
 * @brief   Bounded worker pool for per-file batch work
 * @license MIT
 *
 * @details
 * Fixed number of worker threads draining a FIFO task queue. submit()
 * blocks while the queue holds max_queue_size tasks, which keeps the number
 * of decoded rasters in flight bounded. Tasks must not throw.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace pwm {

/**
 * Number of workers to use when the caller asks for `requested`
 * (0 = hardware concurrency minus one, at least one).
 */
[[nodiscard]] inline unsigned resolve_worker_count(unsigned requested) {
    if (requested > 0) return requested;
    unsigned total = std::thread::hardware_concurrency();
    if (total == 0) total = 4;
    return std::max(1u, total - 1);
}

class ThreadPool {
public:
    explicit ThreadPool(unsigned num_threads, size_t max_queue_size = 0)
        : max_queue_size_(max_queue_size > 0 ? max_queue_size : num_threads * 2) {
        workers_.reserve(num_threads);
        for (unsigned i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a task (blocks while the queue is full)
     */
    void submit(std::function<void()> task) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] {
                return stop_ || queue_.size() < max_queue_size_;
            });
            if (stop_) return;
            ++pending_;
            queue_.push(std::move(task));
        }
        not_empty_.notify_one();
    }

    /**
     * Wait until every submitted task has finished
     */
    void wait_all() {
        std::unique_lock<std::mutex> lock(mutex_);
        done_.wait(lock, [this] { return pending_ == 0; });
    }

    /**
     * Finish queued tasks and join the workers
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) return;
            stop_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

private:
    void worker_loop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                not_empty_.wait(lock, [this] { return stop_ || !queue_.empty(); });
                if (stop_ && queue_.empty()) {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop();
            }
            not_full_.notify_one();

            task();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (--pending_ == 0) {
                    done_.notify_all();
                }
            }
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::condition_variable done_;
    size_t max_queue_size_;
    size_t pending_{0};
    bool stop_{false};
};

}  // namespace pwm
