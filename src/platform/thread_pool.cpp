#include <sleek/platform/thread_pool.h>

#include <algorithm>

namespace sleek::platform {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::try_post(std::function<void()> task, size_t max_pending) {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_ || tasks_.size() >= max_pending) {
            return false;
        }
        tasks_.emplace_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

size_t ThreadPool::size() const {
    return workers_.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return; // Already shut down
        }
        shutdown_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]() {
                return shutdown_.load() || !tasks_.empty();
            });

            if (tasks_.empty()) {
                // shutdown_ is true and no more tasks
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}

} // namespace sleek::platform
