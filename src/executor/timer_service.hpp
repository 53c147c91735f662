/**
 * @file timer_service.hpp
 * @brief Deadline timers fired from a single background std::jthread.
 */

#pragma once

#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace async_responder {

namespace detail {

enum class TimerState : uint8_t { Pending, Fired, Cancelled };

struct TimerEntry {
    SteadyTime deadline;
    std::function<void()> callback;
    std::atomic<TimerState> state{TimerState::Pending};
};

}  // namespace detail

/**
 * @brief Cancel handle for a scheduled timer.
 *
 * Default-constructed handles refer to no timer; cancel() on them is a no-op.
 */
class TimerHandle {
public:
    TimerHandle() = default;
    explicit TimerHandle(std::shared_ptr<detail::TimerEntry> entry) : entry_(std::move(entry)) {}

    /**
     * @brief Prevent the timer from firing.
     * @return true if this call cancelled a pending timer, false if it had
     *         already fired, was already cancelled, or the handle is empty.
     */
    bool cancel() noexcept;

    /// True while the timer is scheduled and has neither fired nor been cancelled.
    [[nodiscard]] bool active() const noexcept;

private:
    std::shared_ptr<detail::TimerEntry> entry_;
};

/**
 * @brief Runs callbacks at their deadlines on a dedicated thread.
 *
 * Callbacks execute on the timer thread and must not block for long; the
 * lifecycle layer only resolves a request from them. Timers still pending
 * when the service is destroyed never fire.
 */
class TimerService {
public:
    TimerService();
    ~TimerService();

    // Non-copyable
    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    TimerHandle schedule(Millis delay, std::function<void()> callback);

    /// Timers queued and not yet fired (cancelled ones count until their deadline passes).
    [[nodiscard]] size_t pending_count() const;

private:
    struct LaterDeadline {
        bool operator()(const std::shared_ptr<detail::TimerEntry>& a,
                        const std::shared_ptr<detail::TimerEntry>& b) const noexcept {
            return a->deadline > b->deadline;
        }
    };

    void timer_loop(std::stop_token stop);

    std::priority_queue<std::shared_ptr<detail::TimerEntry>,
                        std::vector<std::shared_ptr<detail::TimerEntry>>,
                        LaterDeadline> queue_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::jthread thread_;
};

}  // namespace async_responder
