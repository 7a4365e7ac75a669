/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool with cooperative cancellation.
 *
 * Used for HTTP connection handling and for training job execution. Every
 * task receives the worker's stop_token, so long-running tasks observe pool
 * shutdown at their own check points.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace archetype {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 *
 * With a non-zero queue limit, try_submit() refuses work once that many tasks
 * are waiting; submit() always enqueues.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0, size_t max_queued = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that accepts a stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /// Like submit_cancellable(), but nullopt when the queue is full or the pool is stopping.
    template <std::invocable<std::stop_token> F>
    std::optional<std::future<std::invoke_result_t<F, std::stop_token>>> try_submit(F&& func);

    /// Stop accepting work, request stop on all workers and join them.
    /// Queued tasks that never started are abandoned (their futures report broken_promise).
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    using Task = std::function<void(std::stop_token)>;

    template <typename F, typename R>
    static Task wrap(std::shared_ptr<std::promise<R>> promise, F&& func);

    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    size_t max_queued_;
    bool accepting_{true};
};

// ── Template implementations ─────────────────

template <typename F, typename R>
ThreadPool::Task ThreadPool::wrap(std::shared_ptr<std::promise<R>> promise, F&& func) {
    return [p = std::move(promise), f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::is_void_v<R>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    };
}

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    return submit_cancellable([f = std::forward<F>(func)](std::stop_token) mutable {
        return f();
    });
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push(wrap(std::move(promise), std::forward<F>(func)));
    }
    queue_cv_.notify_one();
    return future;
}

template <std::invocable<std::stop_token> F>
std::optional<std::future<std::invoke_result_t<F, std::stop_token>>>
ThreadPool::try_submit(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return std::nullopt;
        if (max_queued_ > 0 && task_queue_.size() >= max_queued_) return std::nullopt;
        task_queue_.push(wrap(std::move(promise), std::forward<F>(func)));
    }
    queue_cv_.notify_one();
    return future;
}

}  // namespace archetype
