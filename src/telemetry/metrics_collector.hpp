/**
 * @file metrics_collector.hpp
 * @brief Structured per-task and per-batch events for telemetry.
 * @author CodeVerdict contributors
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "verdict/resultset.hpp"
#include "verdict/task_result.hpp"

#include <memory>
#include <mutex>

namespace code_verdict {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_task_result(const TaskResult& result);
    void record_retry(const TaskId& id, uint32_t attempt, std::string_view reason);
    void record_batch_summary(const Resultset& resultset, Duration duration);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace code_verdict
