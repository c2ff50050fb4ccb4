/**
 * @file main.cpp
 * @brief code_verdict command-line entry point.
 * @author CodeVerdict contributors
 *
 * Wires all modules into one batch run:
 *   Config → Logger → IsolationBoundary → ExecutionEngine → BatchOrchestrator → Resultset
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/execution_engine.hpp"
#include "orchestrator/batch_orchestrator.hpp"
#include "orchestrator/sandbox_evaluator.hpp"
#include "sandbox/isolation_boundary.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "verdict/resultset_codec.hpp"
#include "workload/batch.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

using namespace code_verdict;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;

struct CLIArgs {
    std::filesystem::path config_path;
    std::filesystem::path config_dir;
    std::string config_pattern = "*.toml";
    std::filesystem::path batch_path;
    std::filesystem::path output_path;
    std::filesystem::path output_dir = "results";
    std::optional<uint32_t> workers;
    std::filesystem::path log_dir;
    bool help = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: code_verdict --batch <file> [OPTIONS]\n"
        << "  --batch <path>           Batch file ([batch] + [[tasks]])\n"
        << "  --config <path>          Configuration file\n"
        << "  --config-dir <dir>       Directory searched for a configuration file\n"
        << "  --config-pattern <glob>  File pattern used with --config-dir (default: *.toml)\n"
        << "  --output <path>          Resultset file to write\n"
        << "  --output-dir <dir>       Directory for a timestamped resultset (default: results)\n"
        << "  --workers <n>            Worker count, 0 = hardware concurrency\n"
        << "  --log-dir <path>         Log output directory (default: stdout)\n"
        << "  --help, -h               Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string{argv[++i]};
        };

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            continue;
        }

        auto value = next();
        if (!value) return Error{ErrorCode::Config, "Missing value for " + arg};

        if (arg == "--config") {
            args.config_path = *value;
        } else if (arg == "--config-dir") {
            args.config_dir = *value;
        } else if (arg == "--config-pattern") {
            args.config_pattern = *value;
        } else if (arg == "--batch") {
            args.batch_path = *value;
        } else if (arg == "--output") {
            args.output_path = *value;
        } else if (arg == "--output-dir") {
            args.output_dir = *value;
        } else if (arg == "--log-dir") {
            args.log_dir = *value;
        } else if (arg == "--workers") {
            try {
                const long parsed = std::stol(*value);
                if (parsed < 0) return Error{ErrorCode::Config, "--workers must not be negative"};
                args.workers = static_cast<uint32_t>(parsed);
            } catch (const std::exception&) {
                return Error{ErrorCode::Config, "Invalid --workers value: " + *value};
            }
        } else {
            return Error{ErrorCode::Config, "Unknown option: " + arg};
        }
    }

    if (!args.help && args.batch_path.empty()) {
        return Error{ErrorCode::Config, "--batch is required"};
    }
    if (!args.config_path.empty() && !args.config_dir.empty()) {
        return Error{ErrorCode::Config, "--config and --config-dir are mutually exclusive"};
    }
    return args;
}

Result<Config> resolve_config(const CLIArgs& args) {
    if (!args.config_path.empty()) return load_config(args.config_path);
    if (!args.config_dir.empty()) {
        auto path = find_config_file(args.config_dir, args.config_pattern);
        if (!path) return path.error();
        return load_config(*path);
    }
    return default_config();
}

std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry) {
    if (telemetry.log_dir.empty()) return std::make_unique<StdoutSink>();
    return std::make_unique<JsonFileSink>(telemetry.log_dir, "code_verdict",
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

std::unique_ptr<ILogSink> make_metrics_sink(const TelemetryConfig& telemetry) {
    if (telemetry.metrics_dir.empty()) return std::make_unique<NullSink>();
    return std::make_unique<JsonFileSink>(telemetry.metrics_dir, "metrics",
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

void print_summary(const Resultset& resultset, const std::filesystem::path& output) {
    std::cout << resultset.name << ": " << resultset.number_passed() << "/" << resultset.size()
              << " passed (" << std::fixed << std::setprecision(1)
              << resultset.percentage_passed() << "%) -> " << output.string() << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << "code_verdict: " << args_result.error().message << "\n";
        print_usage(std::cerr);
        return kExitUsage;
    }
    const auto& args = *args_result;
    if (args.help) {
        print_usage(std::cout);
        return kExitOk;
    }

    auto config_result = resolve_config(args);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return kExitUsage;
    }
    auto config = *config_result;

    // Apply CLI overrides
    if (args.workers) config.orchestrator.workers = *args.workers;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    const auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    Logger logger(make_log_sink(config.telemetry), level);
    MetricsCollector metrics(make_metrics_sink(config.telemetry));

    auto batch = load_batch(args.batch_path);
    if (!batch) {
        logger.error("Failed to load batch: " + batch.error().describe());
        std::cerr << "Failed to load batch: " << batch.error().message << std::endl;
        return kExitUsage;
    }
    logger.info("Loaded batch '" + batch->name + "' with " + std::to_string(batch->size())
                + " tasks from " + args.batch_path.string());

    // ── Initialize Isolation Boundary ────────
    auto policy = CapabilityPolicy::from_names(config.sandbox.allow, config.sandbox.deny);
    if (!policy) {
        logger.error(policy.error().describe());
        std::cerr << "Invalid capability policy: " << policy.error().message << std::endl;
        return kExitUsage;
    }

    auto boundary = IsolationBoundary::create(BoundaryOptions{
        .policy = *policy,
        .scratch_root = config.sandbox.scratch_root,
        .max_file_size_bytes = config.sandbox.max_file_size_mb * 1024 * 1024,
    });
    if (!boundary) {
        logger.error("Cannot set up isolation boundary: " + boundary.error().describe());
        std::cerr << "Cannot set up isolation boundary: " << boundary.error().message << std::endl;
        return kExitUsage;
    }
    std::string denied;
    for (auto capability : policy->denied()) {
        if (!denied.empty()) denied += ",";
        denied += to_string(capability);
    }
    logger.info("Isolation boundary ready: denied [" + denied + "], scratch root "
                + config.sandbox.scratch_root.string());

    ExecutionEngine engine(**boundary, config.sandbox.interpreter, logger);
    SandboxEvaluator evaluator(engine, to_resource_limits(config.limits));

    BatchOrchestrator<SandboxEvaluator> orchestrator(
        evaluator,
        OrchestratorOptions{
            .workers = config.orchestrator.workers,
            .max_task_timeout = std::chrono::milliseconds{config.orchestrator.max_task_timeout_ms},
            .max_attempts = config.orchestrator.max_attempts,
        },
        logger, metrics);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::stop_source batch_stop;
    std::jthread signal_watch([&batch_stop](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                batch_stop.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    // ── Run ──────────────────────────────────
    auto resultset = orchestrator.run(*batch, batch_stop.get_token());
    signal_watch.request_stop();

    const auto output = args.output_path.empty()
        ? generate_output_path(args.output_dir, resultset.name, std::chrono::system_clock::now())
        : args.output_path;
    if (auto written = write_resultset(output, resultset); !written) {
        logger.error("Failed to write resultset: " + written.error().describe());
        std::cerr << "Failed to write resultset: " << written.error().message << std::endl;
        return kExitUsage;
    }

    logger.info("Resultset written to " + output.string());
    logger.flush();
    print_summary(resultset, output);
    return kExitOk;
}
