/**
 * @file task_runner.cpp
 * @brief TaskRunner implementation with interruptible checkpoint waits.
 */

#include "executor/task_runner.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <string>

namespace async_responder {

TaskRunner::TaskRunner(Logger* logger, Payload payload)
    : logger_(logger), payload_(std::move(payload)) {}

Result<Payload> TaskRunner::execute(const TaskRun& run, std::stop_token stop) const {
    if (run.inject_fault) {
        return Error{ErrorKind::TaskError, "An error occurred"};
    }

    if (logger_) {
        logger_->info("Long-running task started for " + run.request_id + ". Duration: "
                      + std::to_string(run.duration.count()) + "ms");
    }

    auto checkpoint = run.checkpoint > Millis{0} ? run.checkpoint : run.duration;
    auto remaining = run.duration;
    while (remaining > Millis{0}) {
        auto step = std::min(remaining, checkpoint);
        if (!wait_checkpoint(step, stop)) {
            if (logger_) logger_->error("Long-running task interrupted: " + run.request_id);
            return Error{ErrorKind::Interrupted, "Task interrupted"};
        }
        remaining -= step;
    }
    return payload_;
}

bool TaskRunner::wait_checkpoint(Millis checkpoint, std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    // Wakes early when stop is requested.
    (void)cv.wait_for(lock, stop, checkpoint, [] { return false; });
    return !stop.stop_requested();
}

}  // namespace async_responder
