/**
 * @file metrics_collector.hpp
 * @brief Structured request-lifecycle events and outcome counters.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "lifecycle/outcome.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

namespace async_responder {

struct OutcomeCounters {
    uint64_t success = 0;
    uint64_t failure = 0;
    uint64_t timeout = 0;
    uint64_t cancelled = 0;
    uint64_t disconnects = 0;
    uint64_t rejected = 0;

    [[nodiscard]] uint64_t resolved() const noexcept {
        return success + failure + timeout + cancelled;
    }
};

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_outcome(const RequestId& id, const Outcome& outcome, Millis elapsed);
    void record_disconnect(const RequestId& id);
    void record_rejection(const RequestId& id, std::string_view reason);

    [[nodiscard]] OutcomeCounters counters() const noexcept;

    void flush();

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    std::atomic<uint64_t> success_{0};
    std::atomic<uint64_t> failure_{0};
    std::atomic<uint64_t> timeout_{0};
    std::atomic<uint64_t> cancelled_{0};
    std::atomic<uint64_t> disconnects_{0};
    std::atomic<uint64_t> rejected_{0};
};

}  // namespace async_responder
