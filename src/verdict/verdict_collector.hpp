/**
 * @file verdict_collector.hpp
 * @brief Folds an execution and its assertion reports into one TaskResult.
 * @author CodeVerdict contributors
 */

#pragma once

#include "engine/execution.hpp"
#include "verdict/task_result.hpp"

#include <string>
#include <vector>

namespace code_verdict {

class VerdictCollector {
public:
    /**
     * @brief Build the TaskResult for @p task_id.
     *
     * A non-Success execution yields no outcomes and passed == false. Otherwise
     * there is exactly one outcome per assertion, in order; an assertion
     * without a matching report is an EvaluationError.
     */
    [[nodiscard]] TaskResult collect(const TaskId& task_id,
                                     const ExecutionResult& execution,
                                     const std::vector<std::string>& assertions,
                                     const std::vector<AssertionReport>& assertion_reports) const;

    /// TaskResult for a task the orchestrator could not execute.
    [[nodiscard]] static TaskResult orchestrator_failure(const TaskId& task_id,
                                                         std::string reason,
                                                         uint32_t attempts);
};

}  // namespace code_verdict
