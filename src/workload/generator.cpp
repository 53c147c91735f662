/**
 * @file generator.cpp
 * @brief WorkloadGenerator and fault injector implementations.
 */

#include "workload/generator.hpp"

namespace async_responder {

namespace {

std::mt19937_64 make_engine(uint64_t seed) {
    if (seed == 0) {
        std::random_device rd;
        seed = (static_cast<uint64_t>(rd()) << 32) | rd();
    }
    return std::mt19937_64{seed};
}

}  // anonymous namespace

// ── RandomFaultInjector ──────────────────────

RandomFaultInjector::RandomFaultInjector(double probability, uint64_t seed)
    : engine_(make_engine(seed)), dist_(probability) {}

bool RandomFaultInjector::should_fail(const RequestId& /*id*/) {
    std::lock_guard lock(mutex_);
    return dist_(engine_);
}

// ── WorkloadGenerator ────────────────────────

WorkloadGenerator::WorkloadGenerator(const TaskConfig& config,
                                     std::shared_ptr<IFaultInjector> faults)
    : checkpoint_(config.checkpoint_ms)
    , faults_(std::move(faults))
    // Distinct stream from the fault injector even when both share a seed.
    , engine_(make_engine(config.seed == 0 ? 0 : config.seed ^ 0x9E3779B97F4A7C15ULL))
    , checkpoints_(config.min_checkpoints, config.max_checkpoints) {}

TaskRun WorkloadGenerator::next(const RequestId& id) {
    uint32_t count = 0;
    {
        std::lock_guard lock(mutex_);
        count = checkpoints_(engine_);
    }
    return TaskRun{
        .request_id = id,
        .duration = checkpoint_ * count,
        .checkpoint = checkpoint_,
        .inject_fault = faults_ ? faults_->should_fail(id) : false
    };
}

}  // namespace async_responder
