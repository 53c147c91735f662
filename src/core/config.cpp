/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace async_responder {

namespace {

/// Read an integer that must fit a uint32_t; negative values are rejected.
template <typename Table>
Result<uint32_t> read_count(const Table& table, std::string_view section,
                            std::string_view key, int64_t fallback) {
    auto value = table[key].value_or(fallback);
    if (value < 0 || value > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return Error{"[" + std::string(section) + "] " + std::string(key)
                     + " out of range: " + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

}  // anonymous namespace

Result<DisconnectPolicy> parse_disconnect_policy(std::string_view text) {
    if (text == "cancel")  return DisconnectPolicy::Cancel;
    if (text == "observe") return DisconnectPolicy::Observe;
    return Error{"Unknown disconnect policy: " + std::string(text)};
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            auto thread_count = read_count(executor, "executor", "thread_count", 0);
            if (!thread_count) return thread_count.error();
            config.executor.thread_count = *thread_count;
            auto max_queued_tasks = read_count(executor, "executor", "max_queued_tasks", 0);
            if (!max_queued_tasks) return max_queued_tasks.error();
            config.executor.max_queued_tasks = *max_queued_tasks;
        }

        // [lifecycle]
        if (auto lifecycle = tbl["lifecycle"]; lifecycle.is_table()) {
            auto suspended_timeout_ms = read_count(lifecycle, "lifecycle", "suspended_timeout_ms", 8000);
            if (!suspended_timeout_ms) return suspended_timeout_ms.error();
            config.lifecycle.suspended_timeout_ms = *suspended_timeout_ms;
            auto future_timeout_ms = read_count(lifecycle, "lifecycle", "future_timeout_ms", 8000);
            if (!future_timeout_ms) return future_timeout_ms.error();
            config.lifecycle.future_timeout_ms = *future_timeout_ms;
            config.lifecycle.timeout_message =
                lifecycle["timeout_message"].value_or(std::string{"Operation timed out"});

            auto policy = parse_disconnect_policy(
                lifecycle["disconnect_policy"].value_or(std::string{"cancel"}));
            if (!policy) return policy.error();
            config.lifecycle.disconnect_policy = *policy;
        }

        // [task]
        if (auto task = tbl["task"]; task.is_table()) {
            auto min_checkpoints = read_count(task, "task", "min_checkpoints", 5);
            if (!min_checkpoints) return min_checkpoints.error();
            config.task.min_checkpoints = *min_checkpoints;
            auto max_checkpoints = read_count(task, "task", "max_checkpoints", 11);
            if (!max_checkpoints) return max_checkpoints.error();
            config.task.max_checkpoints = *max_checkpoints;
            auto checkpoint_ms = read_count(task, "task", "checkpoint_ms", 1000);
            if (!checkpoint_ms) return checkpoint_ms.error();
            config.task.checkpoint_ms = *checkpoint_ms;
            config.task.fault_probability = task["fault_probability"].value_or(0.5);
            config.task.seed = static_cast<uint64_t>(
                task["seed"].value_or(int64_t{0}));
        }

        if (config.task.min_checkpoints > config.task.max_checkpoints) {
            return Error{"[task] min_checkpoints exceeds max_checkpoints"};
        }
        if (config.task.checkpoint_ms == 0) {
            return Error{"[task] checkpoint_ms must be positive"};
        }
        if (config.task.fault_probability < 0.0 || config.task.fault_probability > 1.0) {
            return Error{"[task] fault_probability must be within [0, 1]"};
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            auto max_file_size_mb = read_count(telemetry, "telemetry", "max_file_size_mb", 50);
            if (!max_file_size_mb) return max_file_size_mb.error();
            config.telemetry.max_file_size_mb = *max_file_size_mb;
            auto rotate_count = read_count(telemetry, "telemetry", "rotate_count", 5);
            if (!rotate_count) return rotate_count.error();
            config.telemetry.rotate_count = *rotate_count;
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});

            if (auto level = parse_log_level(config.telemetry.log_level); !level) {
                return level.error();
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace async_responder
