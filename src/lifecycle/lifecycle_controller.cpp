/**
 * @file lifecycle_controller.cpp
 * @brief LifecycleController implementation.
 */

#include "lifecycle/lifecycle_controller.hpp"

#include <chrono>
#include <exception>
#include <vector>

namespace async_responder {

LifecycleController::LifecycleController(ThreadPool& pool,
                                         TimerService& timers,
                                         Logger& logger,
                                         MetricsCollector* metrics)
    : pool_(pool), timers_(timers), logger_(logger), metrics_(metrics) {}

LifecycleController::~LifecycleController() {
    auto cancelled = cancel_all("Server shutting down");
    if (cancelled > 0) {
        logger_.warn("Cancelled " + std::to_string(cancelled) + " in-flight requests at shutdown");
    }

    // Requests another thread won before cancel_all are still delivering and
    // will call release() on this controller. Every tracked request is
    // resolved by now, so this wait is bounded by their transmissions.
    std::unique_lock lock(registry_mutex_);
    idle_cv_.wait(lock, [this] { return registry_.empty(); });
}

RequestId LifecycleController::allocate_id() {
    return "req-" + std::to_string(++next_id_);
}

// ─────────────────────────────────────────────
// Suspend-and-resume surface
// ─────────────────────────────────────────────

AsyncResponse LifecycleController::suspend(std::shared_ptr<IResponseChannel> channel, Millis timeout) {
    auto response = suspend_request(allocate_id(), std::move(channel), timeout, {});

    // No task is attached, so nothing else would end a request whose peer is gone.
    std::weak_ptr<PendingRequest> weak = response.request();
    response.on_disconnect([weak] {
        if (auto pending = weak.lock()) pending->resolve(Cancelled{"Client disconnected"});
    });
    return response;
}

AsyncResponse LifecycleController::suspend_request(RequestId id,
                                                   std::shared_ptr<IResponseChannel> channel,
                                                   Millis timeout,
                                                   std::string timeout_message) {
    auto request = PendingRequest::create(id, channel, &logger_);
    track(request);

    AsyncResponse response(request, timers_);
    response.on_disconnect([metrics = metrics_, id] {
        if (metrics) metrics->record_disconnect(id);
    });

    std::weak_ptr<PendingRequest> weak = request;
    bool watched = channel && channel->watch_disconnect([weak] {
        if (auto pending = weak.lock()) pending->notify_disconnect();
    });
    if (!watched) {
        logger_.debug("Transport for " + id + " does not report disconnects");
    }

    if (!timeout_message.empty()) {
        response.on_timeout([id, message = std::move(timeout_message), logger = &logger_] {
            logger->warn("Request " + id + " timed out");
            return message;
        });
    }
    response.set_timeout(timeout);
    return response;
}

Result<AsyncResponse> LifecycleController::begin_async(TaskFactory factory,
                                                       std::shared_ptr<IResponseChannel> channel,
                                                       const LifecycleOptions& options) {
    return begin_async(allocate_id(), std::move(factory), std::move(channel), options);
}

Result<AsyncResponse> LifecycleController::begin_async(RequestId id,
                                                       TaskFactory factory,
                                                       std::shared_ptr<IResponseChannel> channel,
                                                       const LifecycleOptions& options) {
    auto response = suspend_request(std::move(id), std::move(channel), options.timeout,
                                    options.timeout_message);

    auto submitted = pool_.submit_cancellable(
        [response, factory = std::move(factory), logger = &logger_](std::stop_token stop) mutable {
            if (!response.is_suspended()) {
                logger->debug("Request " + response.id() + " resolved before its task started");
                return;
            }

            bool sent = false;
            try {
                auto result = factory(stop);
                if (result) {
                    sent = response.resume(std::move(*result));
                } else {
                    logger->error("Error during task execution for " + response.id()
                                  + ": " + result.error().message);
                    sent = response.resume(result.error());
                }
            } catch (const std::exception& e) {
                logger->error("Task for " + response.id() + " threw: " + e.what());
                sent = response.resume(Error{ErrorKind::TaskError, e.what()});
            }

            if (!sent) {
                logger->warn("Response for " + response.id() + " not sent, ignored");
            }
        });

    if (!submitted) {
        report_rejection(response.id(), submitted.error());
        response.resume(submitted.error());
        return submitted.error();
    }

    attach_task(response.id(), submitted->stop);
    response.on_disconnect(make_disconnect_handler(response.id(), options.disconnect_policy,
                                                   submitted->stop));

    logger_.info("Request " + response.id() + " is being processed asynchronously");
    return response;
}

// ─────────────────────────────────────────────
// Future-returning surface
// ─────────────────────────────────────────────

Result<ResponseFuture> LifecycleController::begin_future(TaskFactory factory,
                                                         const LifecycleOptions& options) {
    return begin_future(allocate_id(), std::move(factory), options);
}

Result<ResponseFuture> LifecycleController::begin_future(RequestId id,
                                                         TaskFactory factory,
                                                         const LifecycleOptions& options) {
    auto future = ResponseFuture::create(id, timers_, &logger_);
    track(future.request());
    future.complete_after_timeout(options.timeout_message, options.timeout);

    auto submitted = pool_.submit_cancellable(
        [future, factory = std::move(factory), logger = &logger_](std::stop_token stop) mutable {
            if (future.is_done()) {
                logger->debug("Request " + future.id() + " resolved before its task started");
                return;
            }

            bool sent = false;
            try {
                auto result = factory(stop);
                if (result) {
                    sent = future.complete(std::move(*result));
                } else {
                    logger->error("Error during task execution for " + future.id()
                                  + ": " + result.error().message);
                    sent = future.complete_with_error(result.error());
                }
            } catch (const std::exception& e) {
                logger->error("Task for " + future.id() + " threw: " + e.what());
                sent = future.complete_with_error(Error{ErrorKind::TaskError, e.what()});
            }

            if (!sent) {
                logger->warn("Response for " + future.id() + " not sent, ignored");
            }
        });

    if (!submitted) {
        report_rejection(id, submitted.error());
        future.complete_with_error(submitted.error());
        return submitted.error();
    }

    attach_task(id, submitted->stop);
    future.on_cancelled(make_disconnect_handler(id, options.disconnect_policy, submitted->stop));

    logger_.info("Request " + id + " is being processed asynchronously");
    return future;
}

std::function<void()> LifecycleController::make_disconnect_handler(const RequestId& id,
                                                                   DisconnectPolicy policy,
                                                                   std::stop_source task_stop) {
    return [logger = &logger_, id, policy, task_stop]() mutable {
        if (policy == DisconnectPolicy::Cancel) {
            logger->warn("Client disconnected from " + id + ". Cancelling task.");
            task_stop.request_stop();
        } else {
            logger->warn("Client disconnected from " + id + ". Task left running.");
        }
    };
}

// ─────────────────────────────────────────────
// Registry
// ─────────────────────────────────────────────

void LifecycleController::track(const std::shared_ptr<PendingRequest>& request) {
    {
        std::lock_guard lock(registry_mutex_);
        registry_.emplace(request->id(), Tracked{request});
    }

    // release() must be the last use of this: the destructor may return as soon as it has.
    request->register_observer([this, id = request->id(), created_at = request->created_at()](
                                   const Outcome& outcome) {
        try {
            log_outcome(id, outcome);
            if (metrics_) {
                auto elapsed = std::chrono::duration_cast<Millis>(SteadyClock::now() - created_at);
                metrics_->record_outcome(id, outcome, elapsed);
            }
        } catch (const std::exception& e) {
            logger_.error("Recording outcome of " + id + " failed: " + e.what());
        }
        release(id);
    });
}

void LifecycleController::attach_task(const RequestId& id, std::stop_source stop) {
    std::lock_guard lock(registry_mutex_);
    if (auto it = registry_.find(id); it != registry_.end()) {
        it->second.task_stop = std::move(stop);
    }
}

void LifecycleController::release(const RequestId& id) {
    // Notified under the lock so a waiting destructor cannot finish first.
    std::lock_guard lock(registry_mutex_);
    registry_.erase(id);
    if (registry_.empty()) idle_cv_.notify_all();
}

size_t LifecycleController::in_flight() const {
    std::lock_guard lock(registry_mutex_);
    return registry_.size();
}

bool LifecycleController::wait_idle(Millis timeout) {
    std::unique_lock lock(registry_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return registry_.empty(); });
}

size_t LifecycleController::cancel_all(const std::string& reason) {
    std::vector<Tracked> open;
    {
        std::lock_guard lock(registry_mutex_);
        open.reserve(registry_.size());
        for (const auto& [id, tracked] : registry_) open.push_back(tracked);
    }

    size_t cancelled = 0;
    for (auto& tracked : open) {
        if (tracked.task_stop.stop_possible()) tracked.task_stop.request_stop();
        if (tracked.request->resolve(Cancelled{reason})) ++cancelled;
    }
    return cancelled;
}

// ─────────────────────────────────────────────
// Logging
// ─────────────────────────────────────────────

void LifecycleController::log_outcome(const RequestId& id, const Outcome& outcome) {
    switch (outcome.kind()) {
        case OutcomeKind::Success:
            logger_.info("Request " + id + " completed");
            break;
        case OutcomeKind::Failure:
            logger_.error("Request " + id + " completed with error: " + outcome.describe());
            break;
        case OutcomeKind::Timeout:
            logger_.warn("Request " + id + " completed by timeout: " + outcome.describe());
            break;
        case OutcomeKind::Cancelled:
            logger_.warn("Request " + id + " cancelled: " + outcome.describe());
            break;
    }
}

void LifecycleController::report_rejection(const RequestId& id, const Error& error) {
    logger_.error("Request " + id + " rejected: " + error.message);
    if (metrics_) metrics_->record_rejection(id, error.message);
}

}  // namespace async_responder
