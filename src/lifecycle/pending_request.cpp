/**
 * @file pending_request.cpp
 * @brief PendingRequest resolution protocol.
 */

#include "lifecycle/pending_request.hpp"

#include "core/logger.hpp"

#include <exception>

namespace async_responder {

namespace {

constexpr const char* kDefaultTimeoutMessage = "Operation timed out";

}  // anonymous namespace

std::shared_ptr<PendingRequest> PendingRequest::create(RequestId id,
                                                       std::shared_ptr<IResponseChannel> channel,
                                                       Logger* logger) {
    return std::shared_ptr<PendingRequest>(
        new PendingRequest(std::move(id), std::move(channel), logger));
}

PendingRequest::PendingRequest(RequestId id, std::shared_ptr<IResponseChannel> channel, Logger* logger)
    : id_(std::move(id))
    , created_at_(SteadyClock::now())
    , channel_(std::move(channel))
    , logger_(logger) {}

// ─────────────────────────────────────────────
// Resolution
// ─────────────────────────────────────────────

bool PendingRequest::resolve(Outcome outcome) {
    auto expected = RequestState::Open;
    if (!state_.compare_exchange_strong(expected, RequestState::Resolved,
                                        std::memory_order_acq_rel)) {
        return false;
    }

    // Observers may drop the last external reference.
    auto self = shared_from_this();

    std::vector<CompletionCallback> observers;
    TimerHandle timeout;
    {
        std::lock_guard lock(mutex_);
        outcome_ = std::move(outcome);
        delivering_ = true;
        observers.swap(observers_);
        disconnect_observers_.clear();
        timeout_handler_ = nullptr;
        timeout = std::move(timeout_);
    }
    timeout.cancel();

    // outcome_ is written exactly once, above.
    const Outcome& final_outcome = *outcome_;
    transmit(final_outcome);

    // Observers registered while delivering queue up behind the current batch.
    for (;;) {
        for (const auto& callback : observers) {
            notify_observer(callback, final_outcome);
        }
        observers.clear();
        std::lock_guard lock(mutex_);
        if (observers_.empty()) {
            delivering_ = false;
            break;
        }
        observers.swap(observers_);
    }
    return true;
}

bool PendingRequest::is_open() const noexcept {
    return state_.load(std::memory_order_acquire) == RequestState::Open;
}

RequestState PendingRequest::state() const noexcept {
    return state_.load(std::memory_order_acquire);
}

std::optional<Outcome> PendingRequest::outcome() const {
    std::lock_guard lock(mutex_);
    return outcome_;
}

bool PendingRequest::peer_gone() const noexcept {
    return peer_gone_.load(std::memory_order_acquire);
}

// ─────────────────────────────────────────────
// Observers
// ─────────────────────────────────────────────

void PendingRequest::register_observer(CompletionCallback callback) {
    std::optional<Outcome> replay;
    {
        std::lock_guard lock(mutex_);
        if (!outcome_ || delivering_) {
            observers_.push_back(std::move(callback));
            return;
        }
        replay = outcome_;
    }
    notify_observer(callback, *replay);
}

void PendingRequest::register_disconnect_observer(DisconnectCallback callback) {
    {
        std::lock_guard lock(mutex_);
        if (!peer_gone_.load(std::memory_order_acquire)) {
            if (!outcome_) disconnect_observers_.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

void PendingRequest::notify_observer(const CompletionCallback& callback, const Outcome& outcome) {
    try {
        callback(outcome);
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->error("Completion observer for " + id_ + " threw: " + e.what());
        }
    } catch (...) {
        if (logger_) logger_->error("Completion observer for " + id_ + " threw a non-standard exception");
    }
}

// ─────────────────────────────────────────────
// Deadline
// ─────────────────────────────────────────────

void PendingRequest::set_timeout_handler(TimeoutHandler handler) {
    std::lock_guard lock(mutex_);
    if (!outcome_) timeout_handler_ = std::move(handler);
}

void PendingRequest::arm_timeout(TimerService& timers, Millis delay) {
    std::weak_ptr<PendingRequest> weak = weak_from_this();
    TimerHandle previous;
    {
        std::lock_guard lock(mutex_);
        if (outcome_ || peer_gone_.load(std::memory_order_acquire)) return;
        previous = std::move(timeout_);
        timeout_ = timers.schedule(delay, [weak] {
            if (auto self = weak.lock()) self->on_deadline();
        });
    }
    previous.cancel();
}

void PendingRequest::on_deadline() {
    if (!is_open()) return;

    TimeoutHandler handler;
    {
        std::lock_guard lock(mutex_);
        handler = timeout_handler_;
    }

    std::string message = kDefaultTimeoutMessage;
    if (handler) {
        try {
            message = handler();
        } catch (const std::exception& e) {
            if (logger_) logger_->error("Timeout handler for " + id_ + " threw: " + e.what());
        } catch (...) {
            if (logger_) logger_->error("Timeout handler for " + id_ + " threw a non-standard exception");
        }
    }

    if (!resolve(TimedOut{std::move(message)}) && logger_) {
        logger_->debug("Deadline for " + id_ + " discarded, already resolved");
    }
}

// ─────────────────────────────────────────────
// Disconnect
// ─────────────────────────────────────────────

void PendingRequest::notify_disconnect() {
    if (!is_open()) return;
    if (peer_gone_.exchange(true, std::memory_order_acq_rel)) return;

    std::vector<DisconnectCallback> callbacks;
    TimerHandle timeout;
    {
        std::lock_guard lock(mutex_);
        if (outcome_) return;
        callbacks.swap(disconnect_observers_);
        timeout = std::move(timeout_);
    }
    timeout.cancel();

    for (const auto& callback : callbacks) {
        try {
            callback();
        } catch (const std::exception& e) {
            if (logger_) logger_->error("Disconnect observer for " + id_ + " threw: " + e.what());
        } catch (...) {
            if (logger_) logger_->error("Disconnect observer for " + id_ + " threw a non-standard exception");
        }
    }
}

// ─────────────────────────────────────────────
// Transmission
// ─────────────────────────────────────────────

void PendingRequest::transmit(const Outcome& outcome) {
    if (!channel_) return;
    if (peer_gone_.load(std::memory_order_acquire)) {
        if (logger_) logger_->debug("Request " + id_ + " resolved after disconnect, nothing sent");
        return;
    }
    try {
        channel_->send(to_response(outcome));
    } catch (const std::exception& e) {
        if (logger_) logger_->error("Transmission for " + id_ + " failed: " + e.what());
    } catch (...) {
        if (logger_) logger_->error("Transmission for " + id_ + " failed with a non-standard exception");
    }
}

}  // namespace async_responder
