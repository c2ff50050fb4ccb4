/**
 * @file resultset.cpp
 * @brief Resultset aggregation.
 * @author CodeVerdict contributors
 */

#include "verdict/resultset.hpp"

#include <algorithm>

namespace code_verdict {

size_t Resultset::number_passed() const noexcept {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                             [](const TaskResult& r) { return r.passed; }));
}

double Resultset::pass_rate() const noexcept {
    if (results.empty()) return 0.0;
    return static_cast<double>(number_passed()) / static_cast<double>(results.size());
}

const TaskResult* Resultset::find(const TaskId& task_id) const noexcept {
    auto it = std::find_if(results.begin(), results.end(),
                           [&](const TaskResult& r) { return r.task_id == task_id; });
    return it == results.end() ? nullptr : &*it;
}

BenchmarkSummary summarize(const std::vector<Resultset>& resultsets) noexcept {
    BenchmarkSummary summary;
    summary.resultsets = resultsets.size();
    for (const auto& set : resultsets) {
        summary.total_tasks += set.size();
        summary.passed_tasks += set.number_passed();
    }
    if (summary.total_tasks > 0) {
        summary.percentage_passed = 100.0 * static_cast<double>(summary.passed_tasks)
                                  / static_cast<double>(summary.total_tasks);
    }
    return summary;
}

}  // namespace code_verdict
