/**
 * @file response_future.cpp
 * @brief ResponseFuture implementation.
 */

#include "lifecycle/response_future.hpp"

namespace async_responder {

ResponseFuture ResponseFuture::create(RequestId id, TimerService& timers, Logger* logger) {
    auto request = PendingRequest::create(std::move(id), nullptr, logger);
    auto state = std::make_shared<SharedState>();

    // Registered first, so it runs before any subscriber.
    request->register_observer([state](const Outcome& outcome) {
        std::vector<CancelCallback> callbacks;
        {
            std::lock_guard lock(state->mutex);
            state->done = true;
            if (outcome.is<Cancelled>()) {
                state->cancelled = true;
                callbacks.swap(state->cancel_observers);
            } else {
                state->cancel_observers.clear();
            }
        }
        state->cv.notify_all();
        for (const auto& callback : callbacks) callback();
    });

    return ResponseFuture(std::move(request), std::move(state), timers);
}

ResponseFuture::ResponseFuture(std::shared_ptr<PendingRequest> request,
                               std::shared_ptr<SharedState> state,
                               TimerService& timers)
    : request_(std::move(request)), state_(std::move(state)), timers_(&timers) {}

bool ResponseFuture::complete(Payload value) {
    return request_->resolve(Success{std::move(value)});
}

bool ResponseFuture::complete_with_error(Error error) {
    return request_->resolve(Failure{std::move(error)});
}

void ResponseFuture::complete_after_timeout(std::string fallback, Millis delay) {
    request_->set_timeout_handler([fallback = std::move(fallback)] { return fallback; });
    request_->arm_timeout(*timers_, delay);
}

void ResponseFuture::then(PendingRequest::CompletionCallback callback) {
    request_->register_observer(std::move(callback));
}

void ResponseFuture::on_cancelled(CancelCallback callback) {
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->cancelled) {
            if (!state_->done) state_->cancel_observers.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

bool ResponseFuture::cancel(std::string reason) {
    return request_->resolve(Cancelled{std::move(reason)});
}

bool ResponseFuture::is_cancelled() const {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
}

std::optional<Outcome> ResponseFuture::wait_for(Millis timeout) const {
    std::unique_lock lock(state_->mutex);
    if (!state_->cv.wait_for(lock, timeout, [this] { return state_->done; })) {
        return std::nullopt;
    }
    lock.unlock();
    return request_->outcome();
}

Outcome ResponseFuture::get() const {
    std::unique_lock lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->done; });
    lock.unlock();
    return *request_->outcome();
}

}  // namespace async_responder
