/**
 * @file pending_request.hpp
 * @brief Single-resolution slot for one in-flight client request.
 *
 * Several producers race to resolve a request: the worker running its task,
 * the deadline timer, an explicit cancellation. Only the first resolve()
 * succeeds; it records the outcome, cancels the deadline, transmits one
 * response and then runs completion observers in registration order. Every
 * later attempt returns false with no side effects.
 *
 * Observers registered after delivery has finished are invoked immediately,
 * on the registering thread, with the stored outcome. Observers registered
 * while the winner is still transmitting or notifying are queued behind the
 * ones already registered and run by the winner, so registration order holds. Disconnect observers
 * registered after the peer went away are likewise invoked immediately;
 * registered after resolution they are dropped, since no disconnect is
 * tracked any more.
 */

#pragma once

#include "core/types.hpp"
#include "executor/timer_service.hpp"
#include "lifecycle/channel.hpp"
#include "lifecycle/outcome.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace async_responder {

class Logger;

enum class RequestState : uint8_t {
    Open,
    Resolved
};

class PendingRequest : public std::enable_shared_from_this<PendingRequest> {
public:
    using CompletionCallback = std::function<void(const Outcome&)>;
    using DisconnectCallback = std::function<void()>;
    using TimeoutHandler = std::function<std::string()>;

    /**
     * @param channel  where the response is transmitted; nullptr when the
     *                 outcome is consumed through observers only
     * @param logger   optional, receives observer and transmission errors
     */
    static std::shared_ptr<PendingRequest> create(RequestId id,
                                                  std::shared_ptr<IResponseChannel> channel = nullptr,
                                                  Logger* logger = nullptr);

    // Non-copyable
    PendingRequest(const PendingRequest&) = delete;
    PendingRequest& operator=(const PendingRequest&) = delete;

    /**
     * @brief Attempt the Open → Resolved transition.
     * @return true if this call won and its outcome was recorded.
     */
    bool resolve(Outcome outcome);

    /// Best-effort check; resolve() is authoritative.
    [[nodiscard]] bool is_open() const noexcept;
    [[nodiscard]] RequestState state() const noexcept;

    void register_observer(CompletionCallback callback);
    void register_disconnect_observer(DisconnectCallback callback);

    /// Produces the message of the TimedOut outcome when the deadline wins.
    void set_timeout_handler(TimeoutHandler handler);

    /**
     * @brief Schedule the deadline, replacing (and cancelling) any earlier one.
     *
     * Does nothing once the request is resolved or its peer is gone.
     */
    void arm_timeout(TimerService& timers, Millis delay);

    /**
     * @brief The client went away.
     *
     * The first call on an open request cancels the deadline and runs the
     * disconnect observers. It does not resolve the request, and no response
     * will be transmitted when it later resolves.
     */
    void notify_disconnect();

    [[nodiscard]] std::optional<Outcome> outcome() const;
    [[nodiscard]] bool peer_gone() const noexcept;
    [[nodiscard]] const RequestId& id() const noexcept { return id_; }
    [[nodiscard]] SteadyTime created_at() const noexcept { return created_at_; }

private:
    PendingRequest(RequestId id, std::shared_ptr<IResponseChannel> channel, Logger* logger);

    void on_deadline();
    void notify_observer(const CompletionCallback& callback, const Outcome& outcome);
    void transmit(const Outcome& outcome);

    RequestId id_;
    SteadyTime created_at_;
    std::shared_ptr<IResponseChannel> channel_;
    Logger* logger_;

    std::atomic<RequestState> state_{RequestState::Open};
    std::atomic<bool> peer_gone_{false};

    mutable std::mutex mutex_;
    std::optional<Outcome> outcome_;
    bool delivering_ = false;
    std::vector<CompletionCallback> observers_;
    std::vector<DisconnectCallback> disconnect_observers_;
    TimeoutHandler timeout_handler_;
    TimerHandle timeout_;
};

}  // namespace async_responder
