/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace async_responder {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_outcome(const RequestId& id, const Outcome& outcome, Millis elapsed) {
    switch (outcome.kind()) {
        case OutcomeKind::Success:   ++success_; break;
        case OutcomeKind::Failure:   ++failure_; break;
        case OutcomeKind::Timeout:   ++timeout_; break;
        case OutcomeKind::Cancelled: ++cancelled_; break;
    }

    std::ostringstream oss;
    oss << R"({"event":"request_outcome")"
        << R"(,"request":")" << json_escape(id) << "\""
        << R"(,"outcome":")" << to_string(outcome.kind()) << "\""
        << R"(,"status":)" << static_cast<int>(to_response(outcome).status)
        << R"(,"elapsed_ms":)" << elapsed.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_disconnect(const RequestId& id) {
    ++disconnects_;
    std::ostringstream oss;
    oss << R"({"event":"request_disconnect")"
        << R"(,"request":")" << json_escape(id) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_rejection(const RequestId& id, std::string_view reason) {
    ++rejected_;
    std::ostringstream oss;
    oss << R"({"event":"request_rejected")"
        << R"(,"request":")" << json_escape(id) << "\""
        << R"(,"reason":")" << json_escape(reason) << "\""
        << "}";
    emit(oss.str());
}

OutcomeCounters MetricsCollector::counters() const noexcept {
    return OutcomeCounters{
        .success = success_.load(),
        .failure = failure_.load(),
        .timeout = timeout_.load(),
        .cancelled = cancelled_.load(),
        .disconnects = disconnects_.load(),
        .rejected = rejected_.load()
    };
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace async_responder
