/**
 * @file fault_injector.hpp
 * @brief Fault injection strategies for simulated request work.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace async_responder {

/**
 * @brief Decides whether a request's task should fail with a TaskError.
 *
 * Passed explicitly to the workload generator so tests can be deterministic.
 */
class IFaultInjector {
public:
    virtual ~IFaultInjector() = default;

    virtual bool should_fail(const RequestId& id) = 0;
};

/**
 * @brief Fails each request independently with a fixed probability.
 */
class RandomFaultInjector : public IFaultInjector {
public:
    /// @param seed  0 = seed from std::random_device
    explicit RandomFaultInjector(double probability, uint64_t seed = 0);

    bool should_fail(const RequestId& id) override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
    std::bernoulli_distribution dist_;
};

/**
 * @brief Always or never fails.
 */
class FixedFaultInjector : public IFaultInjector {
public:
    explicit FixedFaultInjector(bool fail) : fail_(fail) {}

    bool should_fail(const RequestId& /*id*/) override { return fail_; }

private:
    bool fail_;
};

}  // namespace async_responder
