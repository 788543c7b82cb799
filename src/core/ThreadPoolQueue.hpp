#ifndef THREADPOOLQUEUE_HPP
#define THREADPOOLQUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

// Structure to hold task and its enqueue time
struct TimedTask {
    std::function<void()> task;
    std::chrono::steady_clock::time_point enqueued_time;
};

// Worker pool that runs deliveries off the Boost.Asio I/O threads, so retry
// back-off only ever blocks a worker.
class ThreadPoolQueue {
public:
    ThreadPoolQueue(
        size_t thread_count,
        std::shared_ptr<ILogger> logger)
        : logger_(logger),
        shutdown_(false) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for ThreadPoolQueue");
        }
        if (thread_count == 0) {
            throw std::invalid_argument("ThreadPoolQueue requires at least one thread");
        }
        threads_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back([this] { worker_thread(); });
        }
        logger_->setup("ThreadPoolQueue initialized with " + std::to_string(thread_count) + " threads");
    }

    ~ThreadPoolQueue() {
        shutdown();
    }

    ThreadPoolQueue(const ThreadPoolQueue&) = delete;
    ThreadPoolQueue& operator=(const ThreadPoolQueue&) = delete;

    // Enqueue a task with the current timestamp
    bool enqueue(std::function<void()> fn) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (shutdown_) {
                lock.unlock();
                logger_->error("Attempted to enqueue task on shutdown queue.");
                return false; // Indicate failure to enqueue
            }
            task_queue_.push_back({std::move(fn), std::chrono::steady_clock::now()});
        }
        cv_.notify_one();
        return true; // Indicate successful enqueue
    }

    // Signal threads to stop and join them. Tasks already queued are drained first.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (shutdown_.exchange(true)) {
                return; // Already shutting down
            }
        }
        logger_->debug("Shutting down ThreadPoolQueue...");
        cv_.notify_all(); // Wake up all waiting threads
        for (std::thread& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        logger_->debug("ThreadPoolQueue shut down complete.");
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return task_queue_.size();
    }

private:
    void worker_thread() {
        while (true) {
            TimedTask current_task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                // Wait until queue is not empty OR shutdown is requested
                cv_.wait(lock, [this] { return !task_queue_.empty() || shutdown_; });

                if (shutdown_ && task_queue_.empty()) {
                    return; // Exit thread if shutdown and queue is empty
                }

                current_task = std::move(task_queue_.front());
                task_queue_.pop_front();
            } // queue_mutex_ unlocked here

            if (logger_->isDebugEnabled()) {
                auto waited = std::chrono::duration_cast<std::chrono::microseconds>(
                    std::chrono::steady_clock::now() - current_task.enqueued_time);
                logger_->debug("ThreadPoolQueue task waited " + std::to_string(waited.count()) + "us in queue");
            }

            // Execute the task
            try {
                current_task.task();
            } catch (const std::exception& e) {
                logger_->error("Exception caught in worker thread task: " + std::string(e.what()));
            } catch (...) {
                logger_->error("Unknown exception caught in worker thread task");
            }
        }
    }

    std::shared_ptr<ILogger> logger_;
    std::deque<TimedTask> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> threads_;
    std::atomic<bool> shutdown_;
};

#endif // THREADPOOLQUEUE_HPP
