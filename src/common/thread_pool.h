#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool used to fan out per-feature comparisons

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace sentinel {

/// @brief Fixed set of worker threads draining a FIFO task queue
///
/// Shutdown (explicit or from the destructor) stops accepting work, lets the
/// workers finish everything already queued, and joins them, so no future
/// handed out by Submit is ever left without a value.
///
/// Example usage:
/// @code
///   ThreadPool pool(4);
///   std::vector<double> squares = pool.Map(values, [](double v) { return v * v; });
/// @endcode
class ThreadPool {
public:
    /// @param num_threads Worker count; 0 picks the hardware concurrency
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// @brief Queue a callable; its result or exception arrives through the future
    /// @throws std::runtime_error after Shutdown
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    /// @brief Apply fn to every item on the pool
    /// @return Results in the order of items, regardless of completion order
    template <typename T, typename F>
    auto Map(const std::vector<T>& items, F fn) -> std::vector<std::invoke_result_t<F&, const T&>>;

    /// @brief Stop accepting work, run what is queued and join the workers
    void Shutdown();

    size_t Size() const { return workers_.size(); }

    /// @brief Tasks queued but not yet picked up by a worker
    size_t Pending() const;

private:
    void Enqueue(std::function<void()> task);
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    bool accepting_ = true;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
};

template <typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using R = std::invoke_result_t<F, Args...>;

    // packaged_task is move-only; std::function needs a copyable target
    auto task = std::make_shared<std::packaged_task<R()>>(
        [fn = std::forward<F>(f), ... captured = std::forward<Args>(args)]() mutable {
            return std::invoke(std::move(fn), std::move(captured)...);
        });
    std::future<R> result = task->get_future();
    Enqueue([task]() { (*task)(); });
    return result;
}

template <typename T, typename F>
auto ThreadPool::Map(const std::vector<T>& items, F fn)
    -> std::vector<std::invoke_result_t<F&, const T&>> {
    using R = std::invoke_result_t<F&, const T&>;

    std::vector<std::future<R>> futures;
    futures.reserve(items.size());
    for (const auto& item : items) {
        futures.push_back(Submit([&fn, &item]() { return fn(item); }));
    }

    std::vector<R> results;
    results.reserve(futures.size());
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

}  // namespace sentinel
