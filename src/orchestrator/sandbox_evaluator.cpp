/**
 * @file sandbox_evaluator.cpp
 * @brief SandboxEvaluator implementation.
 * @author CodeVerdict contributors
 */

#include "orchestrator/sandbox_evaluator.hpp"

#include "core/concepts.hpp"

namespace code_verdict {

static_assert(TaskEvaluatorLike<SandboxEvaluator>);
static_assert(TaskEvaluatorLike<const SandboxEvaluator>);

SandboxEvaluator::SandboxEvaluator(const ExecutionEngine& engine, ResourceLimits limits)
    : engine_(engine)
    , limits_(limits) {}

Result<TaskResult> SandboxEvaluator::evaluate(const BatchItem& item, std::stop_token stop) const {
    ExecutionRequest request{
        .task_id = item.id,
        .code = item.code,
        .assertions = item.assertions,
        .limits = limits_,
    };

    auto execution = engine_.execute(request, stop);
    if (!execution) return execution.error();

    return collector_.collect(item.id, execution->result, item.assertions, execution->assertion_reports);
}

}  // namespace code_verdict
