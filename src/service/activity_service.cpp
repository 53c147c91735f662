/**
 * @file activity_service.cpp
 * @brief ActivityService implementation.
 */

#include "service/activity_service.hpp"

namespace async_responder {

ActivityService::ActivityService(const LifecycleConfig& config,
                                 LifecycleController& controller,
                                 WorkloadGenerator& workload,
                                 const TaskRunner& runner,
                                 Logger& logger)
    : suspended_(options_for(config, config.suspended_timeout_ms))
    , future_(options_for(config, config.future_timeout_ms))
    , controller_(controller)
    , workload_(workload)
    , runner_(runner)
    , logger_(logger) {}

LifecycleOptions ActivityService::options_for(const LifecycleConfig& config, uint32_t timeout_ms) {
    return LifecycleOptions{
        .timeout = Millis{timeout_ms},
        .disconnect_policy = config.disconnect_policy,
        .timeout_message = config.timeout_message
    };
}

LifecycleController::TaskFactory ActivityService::make_task(TaskRun run) const {
    return [runner = &runner_, run = std::move(run)](std::stop_token stop) {
        return runner->execute(run, stop);
    };
}

Result<TaskRun> ActivityService::get_activities_suspended(std::shared_ptr<IResponseChannel> channel) {
    auto run = workload_.next(controller_.allocate_id());
    logger_.debug("Suspended request " + run.request_id + " received");

    auto response = controller_.begin_async(run.request_id, make_task(run), std::move(channel), suspended_);
    if (!response) return response.error();
    return run;
}

Result<std::pair<TaskRun, ResponseFuture>> ActivityService::get_activities_future() {
    auto run = workload_.next(controller_.allocate_id());
    logger_.debug("Future request " + run.request_id + " received");

    auto future = controller_.begin_future(run.request_id, make_task(run), future_);
    if (!future) return future.error();
    return std::make_pair(std::move(run), std::move(*future));
}

}  // namespace async_responder
