/*
 * ClawSuite - Thread Pool Implementation
 */
#include <clawsuite/core/thread_pool.hpp>
#include <clawsuite/core/logger.hpp>

#include <chrono>
#include <exception>

namespace clawsuite {

ThreadPool::ThreadPool(size_t num_threads) : running_(0), stop_(false) {
    if (num_threads == 0) num_threads = 1;
    for (size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this] { worker(); });
    }
    LOG_DEBUG("Thread pool started with %zu workers", num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) {
            LOG_WARN("Cannot enqueue task - thread pool is stopped");
            return false;
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

size_t ThreadPool::pending() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return tasks_.size();
}

bool ThreadPool::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
        return tasks_.empty() && running_ == 0;
    });
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) return;
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    LOG_DEBUG("Thread pool shutdown complete");
}

void ThreadPool::worker() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++running_;
        }

        // Execute task outside the lock
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Thread pool task threw exception: %s", e.what());
        } catch (...) {
            LOG_ERROR("Thread pool task threw unknown exception");
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            --running_;
            if (tasks_.empty() && running_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

} // namespace clawsuite
