/**
 * @file verdict_collector.cpp
 * @brief VerdictCollector implementation.
 * @author CodeVerdict contributors
 */

#include "verdict/verdict_collector.hpp"

#include <algorithm>
#include <unordered_map>

namespace code_verdict {

bool compute_passed(const ExecutionResult& execution,
                    const std::vector<AssertionOutcome>& outcomes) noexcept {
    if (execution.terminal != TerminalState::Success) return false;
    return std::all_of(outcomes.begin(), outcomes.end(), [](const AssertionOutcome& outcome) {
        return outcome.status == AssertionStatus::Passed;
    });
}

TaskResult VerdictCollector::collect(const TaskId& task_id,
                                     const ExecutionResult& execution,
                                     const std::vector<std::string>& assertions,
                                     const std::vector<AssertionReport>& assertion_reports) const {
    TaskResult result;
    result.task_id = task_id;
    result.execution = execution;

    if (execution.terminal == TerminalState::Success) {
        std::unordered_map<size_t, const AssertionReport*> by_index;
        for (const auto& reported : assertion_reports) by_index.emplace(reported.index, &reported);

        result.outcomes.reserve(assertions.size());
        for (size_t i = 0; i < assertions.size(); ++i) {
            AssertionOutcome outcome;
            outcome.assertion = assertions[i];
            if (auto it = by_index.find(i); it != by_index.end()) {
                outcome.status = it->second->status;
                outcome.detail = it->second->detail;
                outcome.left = it->second->left;
                outcome.right = it->second->right;
            } else {
                outcome.status = AssertionStatus::EvaluationError;
                outcome.detail = "assertion was not evaluated";
            }
            result.outcomes.push_back(std::move(outcome));
        }
    }

    result.passed = compute_passed(result.execution, result.outcomes);
    return result;
}

TaskResult VerdictCollector::orchestrator_failure(const TaskId& task_id,
                                                  std::string reason,
                                                  uint32_t attempts) {
    TaskResult result;
    result.task_id = task_id;
    result.execution.terminal = TerminalState::OrchestratorFailure;
    result.execution.message = std::move(reason);
    result.attempts = attempts;
    result.passed = false;
    return result;
}

}  // namespace code_verdict
