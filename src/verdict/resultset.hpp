/**
 * @file resultset.hpp
 * @brief Ordered collection of TaskResults for one batch, plus aggregation.
 * @author CodeVerdict contributors
 */

#pragma once

#include "verdict/task_result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace code_verdict {

/**
 * @brief Verdicts of one batch in input order.
 *
 * Holds exactly one TaskResult per submitted task.
 */
struct Resultset {
    std::string name;
    std::string version;
    std::string description;
    std::vector<TaskResult> results;

    [[nodiscard]] size_t size() const noexcept { return results.size(); }
    [[nodiscard]] size_t number_passed() const noexcept;

    /// Fraction of passed tasks in [0, 1]; 0 for an empty set.
    [[nodiscard]] double pass_rate() const noexcept;
    [[nodiscard]] double percentage_passed() const noexcept { return pass_rate() * 100.0; }

    [[nodiscard]] const TaskResult* find(const TaskId& task_id) const noexcept;

    bool operator==(const Resultset&) const = default;
};

/// Totals across several resultsets (e.g. one per model under comparison).
struct BenchmarkSummary {
    size_t resultsets{0};
    size_t total_tasks{0};
    size_t passed_tasks{0};
    double percentage_passed{0.0};
};

[[nodiscard]] BenchmarkSummary summarize(const std::vector<Resultset>& resultsets) noexcept;

}  // namespace code_verdict
