// include/thread_pool.hpp
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future> // For std::future, std::packaged_task
#include <functional> // For std::function
#include <memory>
#include <stdexcept> // For std::runtime_error
#include <type_traits>

namespace PackageSync {
namespace Concurrency {

// Fixed-size pool used to fan out I/O-bound work such as parallel chunk reads.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const { return workers.size(); }

    // Enqueue a task to be executed by a thread in the pool.
    // Returns a std::future that will hold the result of the task; an
    // exception thrown by the task is rethrown from future::get().
    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

private:
    // Need to keep track of threads so we can join them
    std::vector<std::thread> workers;
    // The queue of tasks
    std::queue<std::function<void()>> tasks;

    // Synchronization
    std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop_all; // Flag to signal threads to stop
};

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex);

        // Don't allow enqueueing after stopping the pool
        if (stop_all)
            throw std::runtime_error("enqueue on stopped ThreadPool");

        tasks.emplace([task]() { (*task)(); });
    }
    condition.notify_one();
    return res;
}

} // namespace Concurrency
} // namespace PackageSync
