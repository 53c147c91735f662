/**
 * @file types.hpp
 * @brief Fundamental types used throughout AsyncResponder.
 *
 * Defines RequestId, Payload, Response and the time vocabulary shared by
 * the executor and lifecycle modules.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace async_responder {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using RequestId = std::string;
using Payload = std::string;                       ///< Opaque result value
using Millis = std::chrono::milliseconds;
using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

// ─────────────────────────────────────────────
// Transport-facing Response
// ─────────────────────────────────────────────

enum class StatusCode : uint16_t {
    Ok = 200,
    InternalServerError = 500,
    ServiceUnavailable = 503
};

[[nodiscard]] constexpr std::string_view to_string(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok:                  return "200 OK";
        case StatusCode::InternalServerError: return "500 Internal Server Error";
        case StatusCode::ServiceUnavailable:  return "503 Service Unavailable";
    }
    return "unknown";
}

/**
 * @brief The single terminal transmission handed to the transport layer.
 */
struct Response {
    StatusCode status{StatusCode::Ok};
    std::string body;

    bool operator==(const Response&) const = default;
};

}  // namespace async_responder
