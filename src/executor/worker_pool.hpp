/**
 * @file worker_pool.hpp
 * @brief std::jthread-based worker pool for asynchronous executions.
 *
 * Tasks queued before destruction still run: the destructor drains the
 * queue, then joins. Each task typically blocks on the admission controller
 * and the engine, so the pool is sized to the admission limit. With a queue
 * bound, submit() suspends the caller until a worker frees a slot.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace codebox {

class WorkerPool {
public:
    /// @param num_threads  0 selects hardware_concurrency().
    /// @param max_queued   Tasks allowed to wait for a worker; 0 is unbounded.
    explicit WorkerPool(size_t num_threads = 0, size_t max_queued = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a callable; its result (or exception) arrives through the future.
    /// Blocks while the queue is at its bound.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] size_t max_queued() const noexcept { return max_queued_; }

private:
    void worker_loop(std::stop_token stop);

    size_t max_queued_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable space_cv_;
    std::atomic<size_t> active_tasks_{0};
    std::vector<std::jthread> workers_;  ///< Last: joined before the queue dies
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> WorkerPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::unique_lock lock(queue_mutex_);
        if (max_queued_ > 0) {
            space_cv_.wait(lock, [this] { return task_queue_.size() < max_queued_; });
        }
        task_queue_.push([p = std::move(promise), f = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    queue_cv_.notify_one();
    return future;
}

}  // namespace codebox
