#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool used for per-feature drift comparisons

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

namespace driftscope {

/// @brief A fixed set of worker threads draining a FIFO task queue
///
/// The pool is owned by whoever runs checks (DriftEngine); it is never a
/// process-wide singleton. Destruction drains queued tasks before joining.
class ThreadPool {
public:
    /// @brief Create a pool with the given number of workers
    /// @param num_threads Worker count (0 = hardware concurrency)
    explicit ThreadPool(size_t num_threads = 0);

    /// @brief Waits for queued tasks, then joins all workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Submit a callable and get a future for its result
    template <typename F>
    auto Submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    /// @brief Number of worker threads
    size_t Size() const { return workers_.size(); }

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex mutex_;
    std::condition_variable condition_;
    bool stopping_ = false;
};

template <typename F>
auto ThreadPool::Submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using return_type = std::invoke_result_t<std::decay_t<F>>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Cannot submit task to stopped thread pool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

}  // namespace driftscope
