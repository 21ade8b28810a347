/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for WorkerPool.
 */

#include "executor/worker_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace codebox;
using namespace std::chrono_literals;

TEST(WorkerPoolTest, BasicSubmit) {
    WorkerPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(WorkerPoolTest, MultipleSubmissions) {
    WorkerPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(WorkerPoolTest, ExceptionTravelsThroughFuture) {
    WorkerPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives the throwing task.
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(WorkerPoolTest, DestructorDrainsQueue) {
    std::atomic<int> counter{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 20; ++i) {
            pool.submit([&counter] {
                std::this_thread::sleep_for(1ms);
                counter.fetch_add(1, std::memory_order_relaxed);
            });
        }
    }
    EXPECT_EQ(counter.load(), 20);
}

TEST(WorkerPoolTest, DestructorJoinsWhileTasksTouchThePool) {
    std::atomic<int> counter{0};
    auto pool = std::make_unique<WorkerPool>(2);
    WorkerPool* raw = pool.get();
    for (int i = 0; i < 16; ++i) {
        raw->submit([raw, &counter] {
            std::this_thread::sleep_for(2ms);
            // Queue and mutex must still be alive while the destructor drains.
            (void)raw->queued_count();
            counter.fetch_add(1, std::memory_order_relaxed);
        });
    }
    pool.reset();
    EXPECT_EQ(counter.load(), 16);
}

TEST(WorkerPoolTest, BoundedQueueSuspendsSubmit) {
    WorkerPool pool(1, 1);
    EXPECT_EQ(pool.max_queued(), 1u);

    std::promise<void> gate;
    auto opened = gate.get_future().share();
    std::atomic<bool> running{false};

    auto first = pool.submit([opened, &running] {
        running = true;
        opened.wait();
    });
    while (!running) std::this_thread::sleep_for(1ms);
    auto second = pool.submit([] {});
    EXPECT_EQ(pool.queued_count(), 1u);

    std::atomic<bool> third_queued{false};
    std::future<void> third;
    std::thread submitter([&] {
        third = pool.submit([] {});
        third_queued = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(third_queued.load());
    EXPECT_EQ(pool.queued_count(), 1u);

    gate.set_value();
    submitter.join();
    EXPECT_TRUE(third_queued.load());
    first.get();
    second.get();
    third.get();
}

TEST(WorkerPoolTest, ActiveAndQueuedCounts) {
    WorkerPool pool(1);
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    std::atomic<bool> running{false};

    auto first = pool.submit([opened, &running] {
        running = true;
        opened.wait();
    });
    auto second = pool.submit([] {});

    while (!running) std::this_thread::sleep_for(1ms);
    EXPECT_EQ(pool.active_count(), 1u);
    EXPECT_EQ(pool.queued_count(), 1u);

    gate.set_value();
    first.get();
    second.get();
    EXPECT_EQ(pool.queued_count(), 0u);
}

TEST(WorkerPoolTest, ThreadCount) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);

    WorkerPool defaulted;
    EXPECT_GE(defaulted.thread_count(), 1u);
}
