/*
 * ClawSuite - Worker pool for blocking bridge work
 */
#ifndef CLAWSUITE_CORE_THREAD_POOL_HPP
#define CLAWSUITE_CORE_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace clawsuite {

// Runs tasks that would otherwise block a Crow I/O thread
// (e.g. waiting for the gateway to acknowledge an exec session).
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 4);
    ~ThreadPool();

    // Queue a task. Returns false once the pool is shut down.
    bool enqueue(std::function<void()> task);

    size_t size() const { return threads_.size(); }

    // Tasks queued but not yet picked up
    size_t pending() const;

    // Block until the queue is empty and no task is running, or timeout
    bool wait_idle(int timeout_ms);

    // Stops accepting work, drains the queue, joins workers
    void shutdown();

private:
    void worker();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()> > tasks_;
    size_t running_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    std::atomic<bool> stop_;
};

} // namespace clawsuite

#endif // CLAWSUITE_CORE_THREAD_POOL_HPP
