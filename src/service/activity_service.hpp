/**
 * @file activity_service.hpp
 * @brief The activity endpoints, one per transport surface.
 *
 * Each call draws a simulated workload, hands it to the LifecycleController
 * and returns immediately. Routing and serialization stay with the HTTP
 * layer, which only sees an IResponseChannel or a ResponseFuture.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/task_runner.hpp"
#include "lifecycle/channel.hpp"
#include "lifecycle/lifecycle_controller.hpp"
#include "lifecycle/response_future.hpp"
#include "workload/generator.hpp"

#include <memory>
#include <utility>

namespace async_responder {

class ActivityService {
public:
    ActivityService(const LifecycleConfig& config,
                    LifecycleController& controller,
                    WorkloadGenerator& workload,
                    const TaskRunner& runner,
                    Logger& logger);

    /**
     * @brief Suspended-response endpoint.
     * @return the workload drawn for the request, keyed by its request id.
     */
    Result<TaskRun> get_activities_suspended(std::shared_ptr<IResponseChannel> channel);

    /**
     * @brief Future-returning endpoint.
     */
    Result<std::pair<TaskRun, ResponseFuture>> get_activities_future();

    [[nodiscard]] const LifecycleOptions& suspended_options() const noexcept { return suspended_; }
    [[nodiscard]] const LifecycleOptions& future_options() const noexcept { return future_; }

private:
    LifecycleController::TaskFactory make_task(TaskRun run) const;
    static LifecycleOptions options_for(const LifecycleConfig& config, uint32_t timeout_ms);

    LifecycleOptions suspended_;
    LifecycleOptions future_;
    LifecycleController& controller_;
    WorkloadGenerator& workload_;
    const TaskRunner& runner_;
    Logger& logger_;
};

}  // namespace async_responder
