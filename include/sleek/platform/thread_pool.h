#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace sleek::platform {

// Fixed set of workers draining a FIFO queue. The server hands each accepted
// connection to try_post(); shutdown() lets queued connections finish.
class ThreadPool {
public:
    // 0 picks std::thread::hardware_concurrency() (at least one worker)
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queue a task unless the pool is shut down or max_pending tasks are
    // already waiting
    bool try_post(std::function<void()> task, size_t max_pending);

    // Get number of worker threads
    size_t size() const;

    // Shutdown the pool (waits for pending tasks to complete)
    void shutdown();

private:
    void worker_loop();

    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_{false};
};

} // namespace sleek::platform
