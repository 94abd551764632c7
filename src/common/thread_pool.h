#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool used to replay sessions in parallel

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace turnguard {

/// @brief A simple thread pool; tasks run in submission order per worker
class ThreadPool {
public:
    /// @param num_threads Worker count (0 = hardware concurrency)
    explicit ThreadPool(size_t num_threads = 0);

    /// @brief Drains queued tasks, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Submit a task for execution
    /// @return Future holding the task's result (or its exception)
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    size_t Size() const { return workers_.size(); }

    /// @brief Tasks queued or running
    size_t PendingTasks() const;

    /// @brief Block until every submitted task has finished
    void Wait();

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_condition_;

    bool stop_ = false;
    size_t active_tasks_ = 0;
};

template <typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("Cannot submit task to stopped thread pool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

}  // namespace turnguard
