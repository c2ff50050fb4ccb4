/**
 * @file execution.hpp
 * @brief Value types for one execution of a code artifact.
 * @author CodeVerdict contributors
 */

#pragma once

#include "core/types.hpp"
#include "engine/report_protocol.hpp"
#include "sandbox/capability_policy.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace code_verdict {

struct ExecutionRequest {
    TaskId task_id;
    std::string code;
    std::vector<std::string> assertions;
    ResourceLimits limits;
};

/**
 * @brief How the candidate's run ended, plus everything it printed.
 *
 * @c message holds the parser message for CompileError, "Type: message" and the
 * candidate-only traceback for RuntimeError, the violation detail for
 * CapabilityViolation and the exceeded limit for Timeout.
 */
struct ExecutionResult {
    TerminalState terminal{TerminalState::RuntimeError};
    std::string message;
    std::optional<Capability> violated_capability;
    std::string stdout_text;
    bool stdout_truncated{false};
    std::string stderr_text;
    bool stderr_truncated{false};
    Duration wall_time{0};
    uint64_t peak_memory_bytes{0};

    bool operator==(const ExecutionResult&) const = default;
};

/// An ExecutionResult with the assertion results the driver reported.
struct Execution {
    ExecutionResult result;
    std::vector<AssertionReport> assertion_reports;
};

}  // namespace code_verdict
