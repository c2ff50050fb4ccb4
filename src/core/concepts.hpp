/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for CodeVerdict interfaces.
 * @author CodeVerdict contributors
 *
 * The batch orchestrator is templated on its evaluator so that tests can
 * substitute scripted evaluators for the sandbox without virtual dispatch.
 */

#pragma once

#include "core/result.hpp"

#include <concepts>
#include <stop_token>

namespace code_verdict {

// Forward declarations
struct BatchItem;
struct TaskResult;

// ─────────────────────────────────────────────
// TaskEvaluatorLike
// ─────────────────────────────────────────────

/**
 * @concept TaskEvaluatorLike
 * @brief Turns one batch item into a TaskResult.
 *
 * Called concurrently from several workers. An Error result is a host-level
 * failure; the evaluator must return promptly once @c stop is requested.
 */
template <typename T>
concept TaskEvaluatorLike = requires(T& evaluator, const BatchItem& item, std::stop_token stop) {
    { evaluator.evaluate(item, stop) } -> std::same_as<Result<TaskResult>>;
};

}  // namespace code_verdict
