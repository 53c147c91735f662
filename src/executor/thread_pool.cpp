/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

#include <string>

namespace async_responder {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queued)
    : max_queued_(max_queued) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    // Request stop on all jthreads first
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    // Wake all threads so they can observe the stop request
    queue_cv_.notify_all();
    // Join before the queue and its mutex are destroyed; workers drain the queue first
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

Result<void> ThreadPool::enqueue(Job job) {
    {
        std::lock_guard lock(queue_mutex_);
        if (max_queued_ != 0 && task_queue_.size() >= max_queued_) {
            return Error{ErrorKind::Rejected,
                         "Worker pool queue full (" + std::to_string(max_queued_) + " tasks)"};
        }
        task_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
    return Result<void>{};
}

void ThreadPool::worker_loop(std::stop_token stop) {
    for (;;) {
        Job task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            if (task_queue_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        // Tasks still queued at shutdown run with a stopped token.
        ++active_tasks_;
        task(stop);
        --active_tasks_;
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace async_responder
