/**
 * @file task_runner.hpp
 * @brief Simulated long-running request work with checkpointed cancellation.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <stop_token>
#include <string>

namespace async_responder {

class Logger;

/// Payload returned by a successful activity task.
inline constexpr const char* kActivitiesPayload = R"(["Running", "Swimming", "Cycling"])";

/**
 * @brief One execution of the simulated task.
 */
struct TaskRun {
    RequestId request_id;
    Millis duration{0};             ///< Total work, a whole number of checkpoints
    Millis checkpoint{1000};        ///< Cancellation check granularity
    bool inject_fault{false};       ///< Fail immediately with a TaskError
};

/**
 * @brief Executes TaskRuns, honouring the stop token at every checkpoint.
 *
 * Cancellation is observed within one checkpoint interval at most and is
 * reported as ErrorKind::Interrupted.
 */
class TaskRunner {
public:
    explicit TaskRunner(Logger* logger = nullptr, Payload payload = kActivitiesPayload);

    Result<Payload> execute(const TaskRun& run, std::stop_token stop) const;

private:
    /// Sleep for one checkpoint; returns false if stop was requested meanwhile.
    static bool wait_checkpoint(Millis checkpoint, std::stop_token stop);

    Logger* logger_;
    Payload payload_;
};

}  // namespace async_responder
