/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for AsyncResponder interfaces.
 *
 * Task callables are handed to the worker pool on every request, so they
 * are constrained statically instead of going through a virtual interface.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <stop_token>
#include <type_traits>

namespace async_responder {

// ─────────────────────────────────────────────
// CancellableWork
// ─────────────────────────────────────────────

/**
 * @concept CancellableWork
 * @brief A unit of request work that observes a stop token and produces
 *        either the payload or an error.
 */
template <typename T>
concept CancellableWork = std::invocable<T&, std::stop_token>
    && std::same_as<std::invoke_result_t<T&, std::stop_token>, Result<Payload>>;

}  // namespace async_responder
