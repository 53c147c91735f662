/**
 * @file lifecycle_controller.hpp
 * @brief Orchestrates submission, deadline, disconnect and first-wins
 *        resolution of asynchronous requests.
 *
 * The caller's thread only wires things together and returns; the task runs
 * on the shared ThreadPool, the deadline fires on the TimerService thread,
 * and whichever resolves the request first decides the single response.
 *
 * The controller owns every open request in its in-flight registry and
 * releases it once the terminal outcome has been delivered.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "executor/timer_service.hpp"
#include "lifecycle/async_response.hpp"
#include "lifecycle/channel.hpp"
#include "lifecycle/pending_request.hpp"
#include "lifecycle/response_future.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace async_responder {

struct LifecycleOptions {
    Millis timeout{8000};
    DisconnectPolicy disconnect_policy = DisconnectPolicy::Cancel;
    std::string timeout_message = "Operation timed out";
};

class LifecycleController {
public:
    using TaskFactory = std::function<Result<Payload>(std::stop_token)>;

    LifecycleController(ThreadPool& pool,
                        TimerService& timers,
                        Logger& logger,
                        MetricsCollector* metrics = nullptr);

    /// Cancels whatever is still in flight and waits for in-progress
    /// deliveries to release their requests.
    ~LifecycleController();

    // Non-copyable, non-movable
    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    // ── Suspend-and-resume surface ───────────

    /**
     * @brief Suspend a request on @p channel with a deadline.
     *
     * The caller resumes the returned handle from wherever the result is
     * produced. A 503 with the default timeout message is sent if the
     * deadline wins, unless on_timeout() supplies another message. A client
     * disconnect resolves the request as Cancelled with nothing sent.
     */
    AsyncResponse suspend(std::shared_ptr<IResponseChannel> channel, Millis timeout);

    /**
     * @brief Suspend a request and run @p factory for it on the worker pool.
     *
     * Task success resumes with the payload, task failure (including
     * cooperative interruption) with the error. A client disconnect is
     * handled according to options.disconnect_policy. If the pool rejects
     * the task, the request is resolved as a Rejected failure and the error
     * is returned.
     */
    Result<AsyncResponse> begin_async(TaskFactory factory,
                                      std::shared_ptr<IResponseChannel> channel,
                                      const LifecycleOptions& options);

    /// As above, under an id obtained from allocate_id().
    Result<AsyncResponse> begin_async(RequestId id,
                                      TaskFactory factory,
                                      std::shared_ptr<IResponseChannel> channel,
                                      const LifecycleOptions& options);

    // ── Future-returning surface ─────────────

    /**
     * @brief Run @p factory on the worker pool and return its future at once.
     *
     * Consumer cancellation of the future is handled according to
     * options.disconnect_policy, exactly like a disconnect on the suspended
     * surface.
     */
    Result<ResponseFuture> begin_future(TaskFactory factory, const LifecycleOptions& options);

    Result<ResponseFuture> begin_future(RequestId id,
                                        TaskFactory factory,
                                        const LifecycleOptions& options);

    /// Reserve a request id before the work for it is built.
    RequestId allocate_id();

    // ── Registry ─────────────────────────────

    [[nodiscard]] size_t in_flight() const;

    /// Wait until no request is in flight. Returns false on timeout.
    bool wait_idle(Millis timeout);

    /// Resolve every open request as Cancelled and stop its task.
    size_t cancel_all(const std::string& reason);

private:
    struct Tracked {
        std::shared_ptr<PendingRequest> request;
        std::stop_source task_stop{std::nostopstate};
    };

    AsyncResponse suspend_request(RequestId id,
                                  std::shared_ptr<IResponseChannel> channel,
                                  Millis timeout,
                                  std::string timeout_message);
    void track(const std::shared_ptr<PendingRequest>& request);
    void attach_task(const RequestId& id, std::stop_source stop);
    void release(const RequestId& id);
    void log_outcome(const RequestId& id, const Outcome& outcome);
    void report_rejection(const RequestId& id, const Error& error);

    /// The one place the disconnect policy is applied, for both surfaces.
    std::function<void()> make_disconnect_handler(const RequestId& id,
                                                  DisconnectPolicy policy,
                                                  std::stop_source task_stop);

    ThreadPool& pool_;
    TimerService& timers_;
    Logger& logger_;
    MetricsCollector* metrics_;

    std::atomic<uint64_t> next_id_{0};

    mutable std::mutex registry_mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<RequestId, Tracked> registry_;
};

static_assert(CancellableWork<LifecycleController::TaskFactory>);

}  // namespace async_responder
