/**
 * @file task_result.hpp
 * @brief Per-task verdict types.
 * @author CodeVerdict contributors
 */

#pragma once

#include "core/types.hpp"
#include "engine/execution.hpp"

#include <optional>
#include <string>
#include <vector>

namespace code_verdict {

struct AssertionOutcome {
    std::string assertion;
    AssertionStatus status{AssertionStatus::EvaluationError};
    std::string detail;
    std::optional<std::string> left;
    std::optional<std::string> right;

    bool operator==(const AssertionOutcome&) const = default;
};

/**
 * @brief Final verdict for one submitted task.
 *
 * Invariant: passed == (execution.terminal == Success && every outcome Passed).
 */
struct TaskResult {
    TaskId task_id;
    ExecutionResult execution;
    std::vector<AssertionOutcome> outcomes;
    bool passed{false};
    uint32_t attempts{1};

    bool operator==(const TaskResult&) const = default;
};

/// Recompute TaskResult::passed from the terminal state and the outcomes.
[[nodiscard]] bool compute_passed(const ExecutionResult& execution,
                                  const std::vector<AssertionOutcome>& outcomes) noexcept;

}  // namespace code_verdict
