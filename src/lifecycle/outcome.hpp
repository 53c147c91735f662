/**
 * @file outcome.hpp
 * @brief Terminal outcome of a request and its mapping to a Response.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace async_responder {

struct Success {
    Payload value;
};

struct Failure {
    Error error;
};

struct TimedOut {
    std::string message;
};

struct Cancelled {
    std::string reason;
};

enum class OutcomeKind : uint8_t {
    Success,
    Failure,
    Timeout,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Success:   return "success";
        case OutcomeKind::Failure:   return "failure";
        case OutcomeKind::Timeout:   return "timeout";
        case OutcomeKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Tagged union of the four ways a request can end.
 */
class Outcome {
public:
    Outcome(Success s) : state_(std::move(s)) {}    // NOLINT(implicit)
    Outcome(Failure f) : state_(std::move(f)) {}    // NOLINT(implicit)
    Outcome(TimedOut t) : state_(std::move(t)) {}   // NOLINT(implicit)
    Outcome(Cancelled c) : state_(std::move(c)) {}  // NOLINT(implicit)

    [[nodiscard]] OutcomeKind kind() const noexcept {
        return static_cast<OutcomeKind>(state_.index());
    }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(state_); }

    template <typename T>
    [[nodiscard]] const T& as() const { return std::get<T>(state_); }

    /// Human-readable detail: the error message, timeout message or reason.
    [[nodiscard]] std::string describe() const;

private:
    // Alternative order matches OutcomeKind.
    std::variant<Success, Failure, TimedOut, Cancelled> state_;
};

/**
 * @brief Map an outcome to the response transmitted to the client.
 *
 * Success → 200 with the payload, Failure → 500, TimedOut and Cancelled →
 * 503 with their message.
 */
Response to_response(const Outcome& outcome);

}  // namespace async_responder
