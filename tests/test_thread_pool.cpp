// tests/test_thread_pool.cpp
#include "thread_pool.hpp"

#include <atomic>
#include <stdexcept>

#include <gtest/gtest.h>

namespace PackageSync {
namespace Concurrency {
namespace {

TEST(ThreadPoolTest, RunsTasksAndReturnsResults) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.size(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.enqueue([](int x) { return x * x; }, i));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, TaskExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto failing = pool.enqueue([]() -> int { throw std::runtime_error("read failed"); });
    EXPECT_THROW(failing.get(), std::runtime_error);
}

TEST(ThreadPoolTest, DestructionFinishesQueuedWork) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 50; ++i) {
            pool.enqueue([&done]() { ++done; });
        }
    }
    EXPECT_EQ(done.load(), 50);
}

TEST(ThreadPoolTest, RejectsEmptyPool) {
    EXPECT_THROW(ThreadPool(0), std::runtime_error);
}

} // namespace
} // namespace Concurrency
} // namespace PackageSync
