/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool with per-task cooperative cancellation.
 *
 * Shared process-wide by all in-flight requests. Submission never blocks:
 * a task is either queued or, when the queue bound is reached, rejected
 * with ErrorKind::Rejected.
 */

#pragma once

#include "core/result.hpp"

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace async_responder {

/**
 * @brief Handle to a task submitted with its own stop source.
 */
template <typename R>
struct TaskHandle {
    std::future<R> future;
    std::stop_source stop;

    /// Ask the task to stop at its next checkpoint. Safe from any thread.
    void request_cancel() noexcept { stop.request_stop(); }
};

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 */
class ThreadPool {
public:
    /**
     * @param num_threads  worker count, 0 = hardware_concurrency
     * @param max_queued   queue bound, 0 = unbounded
     */
    explicit ThreadPool(size_t num_threads = 0, size_t max_queued = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    Result<std::future<std::invoke_result_t<F>>> submit(F&& func);

    /// Submit a callable that accepts a stop_token owned by the returned handle.
    template <std::invocable<std::stop_token> F>
    Result<TaskHandle<std::invoke_result_t<F, std::stop_token>>> submit_cancellable(F&& func);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] size_t max_queued() const noexcept { return max_queued_; }

private:
    using Job = std::function<void(std::stop_token)>;

    Result<void> enqueue(Job job);
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<Job> task_queue_;
    size_t max_queued_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
Result<std::future<std::invoke_result_t<F>>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    auto queued = enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token) mutable {
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
    if (!queued) return queued.error();
    return std::move(future);
}

template <std::invocable<std::stop_token> F>
Result<TaskHandle<std::invoke_result_t<F, std::stop_token>>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    TaskHandle<ReturnType> handle{promise->get_future(), std::stop_source{}};

    auto queued = enqueue([p = std::move(promise), f = std::forward<F>(func),
                           task_stop = handle.stop](std::stop_token pool_stop) mutable {
        // Pool shutdown cancels the task too.
        std::stop_callback link(pool_stop, [&task_stop] { task_stop.request_stop(); });
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(task_stop.get_token());
                p->set_value();
            } else {
                p->set_value(f(task_stop.get_token()));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    if (!queued) return queued.error();
    return std::move(handle);
}

}  // namespace async_responder
