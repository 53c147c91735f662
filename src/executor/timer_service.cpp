/**
 * @file timer_service.cpp
 * @brief TimerService implementation.
 */

#include "executor/timer_service.hpp"

namespace async_responder {

// ── TimerHandle ──────────────────────────────

bool TimerHandle::cancel() noexcept {
    if (!entry_) return false;
    auto expected = detail::TimerState::Pending;
    if (!entry_->state.compare_exchange_strong(expected, detail::TimerState::Cancelled,
                                               std::memory_order_acq_rel)) {
        return false;
    }
    // Winning the transition gives exclusive access to the callback.
    entry_->callback = nullptr;
    return true;
}

bool TimerHandle::active() const noexcept {
    return entry_ && entry_->state.load(std::memory_order_acquire) == detail::TimerState::Pending;
}

// ── TimerService ─────────────────────────────

TimerService::TimerService()
    : thread_([this](std::stop_token stop) { timer_loop(stop); }) {}

TimerService::~TimerService() {
    thread_.request_stop();
    cv_.notify_all();
}

TimerHandle TimerService::schedule(Millis delay, std::function<void()> callback) {
    auto entry = std::make_shared<detail::TimerEntry>();
    entry->deadline = SteadyClock::now() + delay;
    entry->callback = std::move(callback);
    {
        std::lock_guard lock(mutex_);
        queue_.push(entry);
    }
    cv_.notify_one();
    return TimerHandle{std::move(entry)};
}

size_t TimerService::pending_count() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void TimerService::timer_loop(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        if (queue_.empty()) {
            cv_.wait(lock, stop, [this] { return !queue_.empty(); });
            continue;
        }

        auto next = queue_.top();
        if (SteadyClock::now() < next->deadline) {
            // Wakes early when an earlier deadline is pushed or on stop.
            cv_.wait_until(lock, stop, next->deadline, [this, &next] {
                return queue_.top() != next;
            });
            continue;
        }
        queue_.pop();

        auto expected = detail::TimerState::Pending;
        if (!next->state.compare_exchange_strong(expected, detail::TimerState::Fired,
                                                 std::memory_order_acq_rel)) {
            continue;  // cancelled
        }

        auto callback = std::move(next->callback);
        lock.unlock();
        if (callback) callback();
        lock.lock();
    }
}

}  // namespace async_responder
