/**
 * @file response_future.hpp
 * @brief Future-returning surface over a PendingRequest.
 *
 * A single-assignment future handed to the HTTP layer immediately. The
 * producer completes it; the consumer subscribes with then(), or blocks with
 * get()/wait_for(). Copies share the same state.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/timer_service.hpp"
#include "lifecycle/pending_request.hpp"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace async_responder {

class ResponseFuture {
public:
    using CancelCallback = std::function<void()>;

    static ResponseFuture create(RequestId id, TimerService& timers, Logger* logger = nullptr);

    /// First writer wins; returns false if the future was already completed.
    bool complete(Payload value);
    bool complete_with_error(Error error);

    /**
     * @brief Race normal completion against a deadline.
     *
     * If nothing completes the future within @p delay, it completes as
     * TimedOut carrying @p fallback.
     */
    void complete_after_timeout(std::string fallback, Millis delay);

    /// Subscribe to the outcome. Invoked immediately if already complete.
    void then(PendingRequest::CompletionCallback callback);

    /**
     * @brief Producer-side notification that the consumer went away.
     *
     * Invoked immediately if the future was already cancelled; dropped if it
     * completed any other way.
     */
    void on_cancelled(CancelCallback callback);

    /// Consumer side: resolve as Cancelled, which notifies on_cancelled observers.
    bool cancel(std::string reason = "Consumer cancelled");

    [[nodiscard]] bool is_done() const noexcept { return !request_->is_open(); }
    [[nodiscard]] bool is_cancelled() const;

    /// Block until complete or until @p timeout elapses.
    [[nodiscard]] std::optional<Outcome> wait_for(Millis timeout) const;

    /// Block until complete.
    [[nodiscard]] Outcome get() const;

    [[nodiscard]] const RequestId& id() const noexcept { return request_->id(); }
    [[nodiscard]] const std::shared_ptr<PendingRequest>& request() const noexcept { return request_; }

private:
    struct SharedState {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        bool done{false};
        bool cancelled{false};
        std::vector<CancelCallback> cancel_observers;
    };

    ResponseFuture(std::shared_ptr<PendingRequest> request,
                   std::shared_ptr<SharedState> state,
                   TimerService& timers);

    std::shared_ptr<PendingRequest> request_;
    std::shared_ptr<SharedState> state_;
    TimerService* timers_;
};

}  // namespace async_responder
