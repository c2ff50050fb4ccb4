/**
 * @file types.hpp
 * @brief Fundamental types used throughout CodeVerdict.
 * @author CodeVerdict contributors
 *
 * Defines TaskId, ResourceLimits, TerminalState, AssertionStatus and other
 * shared vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace code_verdict {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Resource Limits
// ─────────────────────────────────────────────

/**
 * @brief Per-execution resource budget.
 *
 * The wall timeout is enforced by the supervisor's watchdog, the CPU timeout
 * and memory ceiling by rlimits on the sandboxed process.
 */
struct ResourceLimits {
    Duration cpu_timeout{std::chrono::seconds{5}};
    Duration wall_timeout{std::chrono::seconds{5}};
    uint64_t memory_ceiling_bytes{512ULL * 1024 * 1024};
    uint64_t output_cap_bytes{64 * 1024};                ///< Per stream (stdout, stderr)

    auto operator<=>(const ResourceLimits&) const = default;
};

// ─────────────────────────────────────────────
// Terminal State
// ─────────────────────────────────────────────

/**
 * @brief How an execution ended.
 *
 * OrchestratorFailure is never produced by the execution engine; the batch
 * orchestrator assigns it after a host-level failure survives one retry.
 */
enum class TerminalState : uint8_t {
    Success,
    CompileError,
    RuntimeError,
    Timeout,
    CapabilityViolation,
    OrchestratorFailure
};

[[nodiscard]] constexpr std::string_view to_string(TerminalState state) noexcept {
    switch (state) {
        case TerminalState::Success:             return "success";
        case TerminalState::CompileError:        return "compile_error";
        case TerminalState::RuntimeError:        return "runtime_error";
        case TerminalState::Timeout:             return "timeout";
        case TerminalState::CapabilityViolation: return "capability_violation";
        case TerminalState::OrchestratorFailure: return "orchestrator_failure";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<TerminalState> parse_terminal_state(std::string_view name) noexcept {
    if (name == "success")              return TerminalState::Success;
    if (name == "compile_error")        return TerminalState::CompileError;
    if (name == "runtime_error")        return TerminalState::RuntimeError;
    if (name == "timeout")              return TerminalState::Timeout;
    if (name == "capability_violation") return TerminalState::CapabilityViolation;
    if (name == "orchestrator_failure") return TerminalState::OrchestratorFailure;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Assertion Status
// ─────────────────────────────────────────────

enum class AssertionStatus : uint8_t {
    Passed,
    AssertionFailure,   ///< Evaluated to false (a wrong answer)
    EvaluationError     ///< Could not be evaluated (a malformed test)
};

[[nodiscard]] constexpr std::string_view to_string(AssertionStatus status) noexcept {
    switch (status) {
        case AssertionStatus::Passed:           return "passed";
        case AssertionStatus::AssertionFailure: return "assertion_failure";
        case AssertionStatus::EvaluationError:  return "evaluation_error";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<AssertionStatus> parse_assertion_status(std::string_view name) noexcept {
    if (name == "passed")            return AssertionStatus::Passed;
    if (name == "assertion_failure") return AssertionStatus::AssertionFailure;
    if (name == "evaluation_error")  return AssertionStatus::EvaluationError;
    return std::nullopt;
}

}  // namespace code_verdict
