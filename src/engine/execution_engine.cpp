/**
 * @file execution_engine.cpp
 * @brief ExecutionEngine implementation.
 * @author CodeVerdict contributors
 */

#include "engine/execution_engine.hpp"
#include "engine/python_driver.hpp"

#include <signal.h>

#include <chrono>

namespace code_verdict {

namespace {

constexpr size_t kStderrTailLines = 20;

std::string_view signal_name(int sig) noexcept {
    switch (sig) {
        case SIGSEGV: return "SIGSEGV";
        case SIGABRT: return "SIGABRT";
        case SIGKILL: return "SIGKILL";
        case SIGBUS:  return "SIGBUS";
        case SIGFPE:  return "SIGFPE";
        case SIGILL:  return "SIGILL";
        case SIGXFSZ: return "SIGXFSZ";
        case SIGPIPE: return "SIGPIPE";
        case SIGTERM: return "SIGTERM";
        case SIGXCPU: return "SIGXCPU";
        default:      return "signal";
    }
}

/// Last @p max_lines lines of @p text.
std::string tail_lines(const std::string& text, size_t max_lines) {
    size_t end = text.size();
    while (end > 0 && text[end - 1] == '\n') --end;
    size_t pos = end;
    size_t lines = 0;
    while (pos > 0) {
        if (text[pos - 1] == '\n' && ++lines == max_lines) break;
        --pos;
    }
    return text.substr(pos, end - pos);
}

std::string describe_termination(const SandboxOutcome& outcome) {
    if (outcome.term_signal) {
        return "interpreter terminated by " + std::string{signal_name(*outcome.term_signal)}
             + " (" + std::to_string(*outcome.term_signal) + ")";
    }
    if (outcome.exit_code) {
        return "interpreter exited with status " + std::to_string(*outcome.exit_code);
    }
    return "interpreter ended without an exit status";
}

std::string milliseconds(Duration duration) {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count()) + " ms";
}

std::string violation_message(const Violation& violation) {
    return "capability '" + std::string{to_string(violation.capability)}
         + "' denied: " + violation.detail;
}

}  // namespace

ExecutionEngine::ExecutionEngine(const IsolationBoundary& boundary,
                                 std::filesystem::path interpreter,
                                 Logger& logger)
    : boundary_(boundary), interpreter_(std::move(interpreter)), logger_(logger) {}

LaunchSpec ExecutionEngine::launch_spec(const std::filesystem::path& scratch_dir) const {
    LaunchSpec spec{
        .executable = interpreter_,
        .argv = {interpreter_.string(), "-s", "-B", "-u", "-X", "utf8", "-c",
                 std::string{python_driver_source()}},
        .env = {"PYTHONHASHSEED=0"},
    };
    if (!boundary_.policy().allows(Capability::EnvironmentAccess)) return spec;

    const std::string scratch = scratch_dir.string();
    spec.env.insert(spec.env.end(), {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "HOME=" + scratch,
        "TMPDIR=" + scratch,
        "LANG=C.UTF-8",
        "LC_ALL=C.UTF-8",
        "PYTHONIOENCODING=utf-8",
        "OPENBLAS_NUM_THREADS=1",
        "OMP_NUM_THREADS=1",
    });
    return spec;
}

Result<Execution> ExecutionEngine::execute(const ExecutionRequest& request,
                                           std::stop_token stop) const {
    auto scratch = boundary_.provision();
    if (!scratch) return scratch.error();

    const DriverRequest driver_request{
        .token = make_session_token(),
        .code = request.code,
        .assertions = request.assertions,
        .guard_environment = !boundary_.policy().allows(Capability::EnvironmentAccess),
    };
    if (auto written = write_request_file(scratch->path(), driver_request); !written) {
        release(*scratch, request.task_id);
        return written.error();
    }

    auto outcome = boundary_.run(*scratch, launch_spec(scratch->path()), request.limits, stop);
    release(*scratch, request.task_id);
    if (!outcome) return outcome.error();

    const DriverReport report = decode_report(outcome->channel, driver_request.token);
    if (report.rejected_lines > 0) {
        logger_.log(LogLevel::Warn, "engine",
                    "task " + request.task_id + ": ignored " + std::to_string(report.rejected_lines)
                        + " malformed report record(s)");
    }
    if (report.tampering) {
        logger_.log(LogLevel::Warn, "engine",
                    "task " + request.task_id + ": report channel tampering: " + *report.tampering);
    }

    Execution execution;
    execution.result = classify(*outcome, report, request.limits);
    if (execution.result.terminal == TerminalState::Success) {
        execution.assertion_reports = report.assertion_reports;
    }

    logger_.log(LogLevel::Debug, "engine",
                "task " + request.task_id + " -> " + std::string{to_string(execution.result.terminal)}
                    + " wall=" + std::to_string(execution.result.wall_time.count()) + "us"
                    + " peak=" + std::to_string(execution.result.peak_memory_bytes) + "B");
    return execution;
}

void ExecutionEngine::release(ScratchEnvironment& scratch, const TaskId& task_id) const {
    if (auto removed = scratch.remove(); !removed) {
        logger_.log(LogLevel::Error, "engine", "task " + task_id + ": " + removed.error().message);
    }
}

ExecutionResult ExecutionEngine::classify(const SandboxOutcome& outcome,
                                          const DriverReport& report,
                                          const ResourceLimits& limits) {
    ExecutionResult result;
    result.stdout_text = outcome.stdout_stream.text;
    result.stdout_truncated = outcome.stdout_stream.truncated;
    result.stderr_text = outcome.stderr_stream.text;
    result.stderr_truncated = outcome.stderr_stream.truncated;
    result.wall_time = outcome.wall_time;
    result.peak_memory_bytes = outcome.peak_memory_bytes;

    if (const auto& violation = outcome.violation ? outcome.violation : report.violation) {
        result.terminal = TerminalState::CapabilityViolation;
        result.violated_capability = violation->capability;
        result.message = violation_message(*violation);
        return result;
    }

    if (outcome.timed_out) {
        result.terminal = TerminalState::Timeout;
        result.message = "wall-clock limit of " + milliseconds(limits.wall_timeout) + " exceeded";
        return result;
    }
    if (outcome.cpu_limit_exceeded) {
        result.terminal = TerminalState::Timeout;
        result.message = "CPU time limit of " + milliseconds(limits.cpu_timeout) + " exceeded";
        return result;
    }

    if (report.tampering) {
        result.terminal = TerminalState::RuntimeError;
        result.message = "report channel tampering: " + *report.tampering;
        return result;
    }
    if (report.compile_error) {
        result.terminal = TerminalState::CompileError;
        result.message = *report.compile_error;
        return result;
    }
    if (report.runtime_error) {
        result.terminal = TerminalState::RuntimeError;
        result.message = *report.runtime_error;
        return result;
    }
    if (report.executed && report.done) {
        result.terminal = TerminalState::Success;
        return result;
    }

    result.terminal = TerminalState::RuntimeError;
    result.message = describe_termination(outcome);
    if (report.executed) result.message += " during assertion evaluation";
    else if (!report.ready) result.message += " before the driver started";
    const std::string tail = tail_lines(outcome.stderr_stream.text, kStderrTailLines);
    if (!tail.empty()) result.message += "\n" + tail;
    return result;
}

}  // namespace code_verdict
