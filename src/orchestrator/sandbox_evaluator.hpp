/**
 * @file sandbox_evaluator.hpp
 * @brief Production evaluator: execution engine followed by the verdict collector.
 * @author CodeVerdict contributors
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/execution_engine.hpp"
#include "verdict/task_result.hpp"
#include "verdict/verdict_collector.hpp"
#include "workload/batch.hpp"

#include <stop_token>

namespace code_verdict {

class SandboxEvaluator {
public:
    SandboxEvaluator(const ExecutionEngine& engine, ResourceLimits limits);

    [[nodiscard]] Result<TaskResult> evaluate(const BatchItem& item, std::stop_token stop) const;

    [[nodiscard]] const ResourceLimits& limits() const noexcept { return limits_; }

private:
    const ExecutionEngine& engine_;
    ResourceLimits limits_;
    VerdictCollector collector_;
};

}  // namespace code_verdict
