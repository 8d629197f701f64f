/**
 * @file test_thread_pool.cpp
 * @brief ThreadPool: immediate tasks, deferred tasks, shutdown semantics
 */

#include <gtest/gtest.h>
#include "kg_logger.hpp"
#include "kg_thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace kg;
using namespace std::chrono_literals;

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::NONE);
    }
};

TEST_F(ThreadPoolTest, SubmitAfterShutdownThrows) {
    ThreadPool pool(2);
    pool.shutdown();

    EXPECT_THROW({
        pool.submit([]() { return 42; });
    }, std::runtime_error);
    EXPECT_THROW(pool.post([] {}), std::runtime_error);
    EXPECT_THROW(pool.post_after(1s, [] {}), std::runtime_error);
}

TEST_F(ThreadPoolTest, SubmitReturnsResult) {
    ThreadPool pool(2);
    auto future = pool.submit([]() { return 123; });
    EXPECT_EQ(future.get(), 123);
}

TEST_F(ThreadPoolTest, MultipleTasks) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST_F(ThreadPoolTest, SubmittedExceptionReachesFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int {
        throw std::runtime_error("task error");
    });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(ThreadPoolTest, PostedExceptionDoesNotKillWorker) {
    ThreadPool pool(1);
    pool.post([] { throw std::runtime_error("boom"); });
    auto future = pool.submit([]() { return 7; });
    EXPECT_EQ(future.get(), 7);
}

TEST_F(ThreadPoolTest, DeferredTaskWaitsForDelay) {
    ThreadPool pool(1);
    std::atomic<bool> ran{false};
    auto posted = std::chrono::steady_clock::now();
    std::atomic<long long> elapsed_ms{0};

    pool.post_after(100ms, [&] {
        elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - posted).count();
        ran = true;
    });
    EXPECT_EQ(pool.deferred_tasks(), 1u);

    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(ran.load());

    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (!ran && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(ran.load());
    EXPECT_GE(elapsed_ms.load(), 100);
    EXPECT_EQ(pool.deferred_tasks(), 0u);
}

TEST_F(ThreadPoolTest, DeferredTasksRunInDeadlineOrder) {
    ThreadPool pool(1);
    std::mutex mtx;
    std::vector<int> order;

    pool.post_after(150ms, [&] { std::lock_guard<std::mutex> l(mtx); order.push_back(3); });
    pool.post_after(50ms,  [&] { std::lock_guard<std::mutex> l(mtx); order.push_back(1); });
    pool.post_after(100ms, [&] { std::lock_guard<std::mutex> l(mtx); order.push_back(2); });

    std::this_thread::sleep_for(400ms);
    pool.shutdown();

    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
    EXPECT_EQ(order[2], 3);
}

TEST_F(ThreadPoolTest, ShutdownRunsPendingDeferredTasks) {
    std::atomic<int> ran{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 5; ++i) {
            pool.post_after(1h, [&] { ran.fetch_add(1); });
        }
        EXPECT_EQ(pool.deferred_tasks(), 5u);
        pool.shutdown();
        EXPECT_FALSE(pool.is_running());
    }
    EXPECT_EQ(ran.load(), 5);
}

TEST_F(ThreadPoolTest, DeferredTaskReleasesCapturesAfterRunning) {
    ThreadPool pool(1);
    auto payload = std::make_shared<int>(42);
    std::weak_ptr<int> watch = payload;
    std::atomic<int> seen{0};

    pool.post_after(10ms, [payload, &seen] { seen = *payload; });
    payload.reset();

    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (!watch.expired() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(seen.load(), 42);
    EXPECT_TRUE(watch.expired());
    EXPECT_EQ(pool.deferred_tasks(), 0u);
}

TEST_F(ThreadPoolTest, Metrics) {
    ThreadPool pool(2);

    EXPECT_EQ(pool.total_threads(), 2u);
    EXPECT_TRUE(pool.is_running());
    EXPECT_EQ(pool.active_threads(), 0u);
    EXPECT_EQ(pool.pending_tasks(), 0u);

    auto future = pool.submit([]() {
        std::this_thread::sleep_for(100ms);
        return 42;
    });

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(pool.active_threads(), 1u);

    EXPECT_EQ(future.get(), 42);
}

TEST_F(ThreadPoolTest, ZeroThreadsMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.total_threads(), 1u);
}
