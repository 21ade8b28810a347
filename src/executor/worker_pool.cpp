/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 */

#include "executor/worker_pool.hpp"

namespace codebox {

WorkerPool::WorkerPool(size_t num_threads, size_t max_queued)
    : max_queued_(max_queued) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

WorkerPool::~WorkerPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void WorkerPool::worker_loop(std::stop_token stop) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            if (task_queue_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }
            task = std::move(task_queue_.front());
            task_queue_.pop();
        }
        space_cv_.notify_one();

        ++active_tasks_;
        task();
        --active_tasks_;
    }
}

size_t WorkerPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t WorkerPool::queued_count() const {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t WorkerPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace codebox
