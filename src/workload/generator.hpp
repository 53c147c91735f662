/**
 * @file generator.hpp
 * @brief Draws the TaskRun (duration, fault flag) for each inbound request.
 */

#pragma once

#include "core/config.hpp"
#include "executor/task_runner.hpp"
#include "workload/fault_injector.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace async_responder {

/**
 * @brief Thread-safe generator of simulated request workloads.
 *
 * Durations are a whole number of checkpoints drawn uniformly from
 * [min_checkpoints, max_checkpoints].
 */
class WorkloadGenerator {
public:
    WorkloadGenerator(const TaskConfig& config, std::shared_ptr<IFaultInjector> faults);

    TaskRun next(const RequestId& id);

    [[nodiscard]] Millis checkpoint() const noexcept { return checkpoint_; }

private:
    Millis checkpoint_;
    std::shared_ptr<IFaultInjector> faults_;
    std::mutex mutex_;
    std::mt19937_64 engine_;
    std::uniform_int_distribution<uint32_t> checkpoints_;
};

}  // namespace async_responder
