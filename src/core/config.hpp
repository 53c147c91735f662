/**
 * @file config.hpp
 * @brief Service configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace async_responder {

/**
 * @brief What a client disconnect does to the in-flight task.
 *
 * Applied identically on the suspended and the future surface.
 */
enum class DisconnectPolicy : uint8_t {
    Cancel,     ///< Request cooperative cancellation of the task
    Observe     ///< Log only; the task runs to completion
};

[[nodiscard]] constexpr std::string_view to_string(DisconnectPolicy policy) noexcept {
    switch (policy) {
        case DisconnectPolicy::Cancel:  return "cancel";
        case DisconnectPolicy::Observe: return "observe";
    }
    return "unknown";
}

Result<DisconnectPolicy> parse_disconnect_policy(std::string_view text);

struct ExecutorConfig {
    uint32_t thread_count = 0;          ///< 0 = hardware_concurrency
    uint32_t max_queued_tasks = 0;      ///< 0 = unbounded
};

struct LifecycleConfig {
    uint32_t suspended_timeout_ms = 8000;
    uint32_t future_timeout_ms = 8000;
    DisconnectPolicy disconnect_policy = DisconnectPolicy::Cancel;
    std::string timeout_message = "Operation timed out";
};

struct TaskConfig {
    uint32_t min_checkpoints = 5;
    uint32_t max_checkpoints = 11;
    uint32_t checkpoint_ms = 1000;
    double fault_probability = 0.5;
    uint64_t seed = 0;                  ///< 0 = seed from std::random_device
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< empty = stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level service configuration.
 */
struct Config {
    ExecutorConfig executor;
    LifecycleConfig lifecycle;
    TaskConfig task;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Fails on a missing file, a parse error,
 * an unknown enum string or an inconsistent [task] range.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace async_responder
