/**
 * @file main.cpp
 * @brief AsyncResponder driver entry point.
 *
 * Wires all modules together and drives a burst of simulated requests:
 *   Config → Logger → ThreadPool/TimerService → LifecycleController → ActivityService
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/task_runner.hpp"
#include "executor/thread_pool.hpp"
#include "executor/timer_service.hpp"
#include "lifecycle/channel.hpp"
#include "lifecycle/lifecycle_controller.hpp"
#include "lifecycle/response_future.hpp"
#include "service/activity_service.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workload/fault_injector.hpp"
#include "workload/generator.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace async_responder;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

enum class Mode { Suspended, Future };

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    uint32_t requests = 10;
    Mode mode = Mode::Suspended;
    int64_t disconnect_after_ms = -1;       ///< <0 = clients never disconnect
    std::string log_dir;
};

void print_usage() {
    std::cout << "Usage: async_responder [OPTIONS]\n"
              << "  --config <path>              Configuration file (default: config/default.toml)\n"
              << "  --requests <n>               Concurrent requests to issue (default: 10)\n"
              << "  --mode <suspended|future>    Transport surface to exercise (default: suspended)\n"
              << "  --disconnect-after-ms <ms>   Simulate every client disconnecting after <ms>\n"
              << "  --log-dir <path>             Log output directory (default: stdout)\n"
              << "  --help, -h                   Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--requests" && i + 1 < argc) {
                args.requests = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--mode" && i + 1 < argc) {
                std::string mode = argv[++i];
                if (mode == "suspended") {
                    args.mode = Mode::Suspended;
                } else if (mode == "future") {
                    args.mode = Mode::Future;
                } else {
                    return Error{"Unknown mode: " + mode};
                }
            } else if (arg == "--disconnect-after-ms" && i + 1 < argc) {
                args.disconnect_after_ms = std::stoll(argv[++i]);
            } else if (arg == "--log-dir" && i + 1 < argc) {
                args.log_dir = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                std::exit(0);
            } else {
                return Error{"Unknown argument: " + arg};
            }
        }
    } catch (const std::logic_error& e) {
        return Error{std::string{"Invalid numeric argument: "} + e.what()};
    }
    return args;
}

std::string summarize(const OutcomeCounters& c) {
    return "success=" + std::to_string(c.success)
         + " failure=" + std::to_string(c.failure)
         + " timeout=" + std::to_string(c.timeout)
         + " cancelled=" + std::to_string(c.cancelled)
         + " disconnects=" + std::to_string(c.disconnects)
         + " rejected=" + std::to_string(c.rejected);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << std::endl;
        print_usage();
        return 2;
    }
    auto args = *args_result;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "async_responder",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    logger.info("AsyncResponder starting...");
    logger.info("Suspended timeout: " + std::to_string(config.lifecycle.suspended_timeout_ms)
                + "ms, future timeout: " + std::to_string(config.lifecycle.future_timeout_ms)
                + "ms, disconnect policy: " + std::string(to_string(config.lifecycle.disconnect_policy)));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Executor ──────────────────
    // Default: one worker per request in the burst, so no task waits behind another.
    auto thread_count = config.executor.thread_count == 0
        ? std::max<size_t>(std::thread::hardware_concurrency(), args.requests)
        : config.executor.thread_count;
    MetricsCollector metrics(std::make_unique<NullSink>());
    auto faults = std::make_shared<RandomFaultInjector>(config.task.fault_probability, config.task.seed);
    WorkloadGenerator workload(config.task, faults);
    TaskRunner runner(&logger);

    // Declared after everything its tasks reference, so it drains first.
    TimerService timers;
    ThreadPool pool(thread_count, config.executor.max_queued_tasks);
    logger.info("Executor: " + std::to_string(pool.thread_count()) + " threads, queue bound "
                + std::to_string(config.executor.max_queued_tasks));

    int exit_code = 0;
    {
        LifecycleController controller(pool, timers, logger, &metrics);
        ActivityService service(config.lifecycle, controller, workload, runner, logger);

        // ── Issue the burst ──────────────────
        std::vector<std::shared_ptr<BufferedChannel>> channels;
        std::vector<ResponseFuture> futures;
        for (uint32_t i = 0; i < args.requests; ++i) {
            if (args.mode == Mode::Suspended) {
                auto channel = std::make_shared<BufferedChannel>();
                auto run = service.get_activities_suspended(channel);
                if (!run) {
                    logger.error("Request not accepted: " + run.error().message);
                    continue;
                }
                channels.push_back(std::move(channel));
            } else {
                auto accepted = service.get_activities_future();
                if (!accepted) {
                    logger.error("Request not accepted: " + accepted.error().message);
                    continue;
                }
                futures.push_back(accepted->second);
            }
        }

        // ── Simulated disconnects ────────────
        if (args.disconnect_after_ms >= 0) {
            std::this_thread::sleep_for(Millis{args.disconnect_after_ms});
            for (auto& channel : channels) channel->disconnect();
            for (auto& future : futures) future.cancel();
        }

        // ── Wait for the burst to drain ──────
        while (!g_shutdown_requested && !controller.wait_idle(Millis{200})) {
        }
        if (g_shutdown_requested) {
            auto cancelled = controller.cancel_all("Server shutting down");
            logger.warn("Shutdown requested, cancelled " + std::to_string(cancelled) + " requests");
            exit_code = 130;
        }

        size_t transmissions = 0;
        for (const auto& channel : channels) {
            transmissions += channel->send_count();
            if (channel->send_count() > 1) {
                logger.error("Channel received more than one response");
                exit_code = 1;
            }
        }
        logger.info("Responses transmitted: " + std::to_string(transmissions));
    }

    logger.info("Outcomes: " + summarize(metrics.counters()));
    logger.info("AsyncResponder finished");
    logger.flush();
    return exit_code;
}
