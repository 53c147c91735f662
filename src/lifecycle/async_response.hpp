/**
 * @file async_response.hpp
 * @brief Suspend-and-resume surface over a PendingRequest.
 *
 * The HTTP layer suspends a request, hands this handle to whoever produces
 * the result, and returns. The first of resume(value), resume(error),
 * cancel() or the deadline ends the request.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/timer_service.hpp"
#include "lifecycle/pending_request.hpp"

#include <memory>
#include <string>

namespace async_responder {

class AsyncResponse {
public:
    AsyncResponse(std::shared_ptr<PendingRequest> request, TimerService& timers)
        : request_(std::move(request)), timers_(&timers) {}

    /// Resolve with Success. Returns false if the request was already resolved.
    bool resume(Payload value);

    /// Resolve with Failure.
    bool resume(Error error);

    /// Resolve with Cancelled; transmitted as 503 with the reason.
    bool cancel(std::string reason = "Request cancelled");

    /// (Re)start the deadline, measured from now.
    void set_timeout(Millis timeout);

    /// Provide the message sent when the deadline wins.
    void on_timeout(PendingRequest::TimeoutHandler handler);

    void on_disconnect(PendingRequest::DisconnectCallback callback);
    void on_completion(PendingRequest::CompletionCallback callback);

    [[nodiscard]] bool is_suspended() const noexcept { return request_->is_open(); }
    [[nodiscard]] const RequestId& id() const noexcept { return request_->id(); }
    [[nodiscard]] const std::shared_ptr<PendingRequest>& request() const noexcept { return request_; }

private:
    std::shared_ptr<PendingRequest> request_;
    TimerService* timers_;
};

}  // namespace async_responder
