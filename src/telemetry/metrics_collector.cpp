/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author CodeVerdict contributors
 */

#include "telemetry/metrics_collector.hpp"

#include "core/text.hpp"

#include <sstream>

namespace code_verdict {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_task_result(const TaskResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"task_result")"
        << R"(,"task":")" << json_escape(result.task_id) << "\""
        << R"(,"terminal":")" << to_string(result.execution.terminal) << "\""
        << R"(,"passed":)" << (result.passed ? "true" : "false")
        << R"(,"wall_time_us":)" << result.execution.wall_time.count()
        << R"(,"peak_memory_bytes":)" << result.execution.peak_memory_bytes
        << R"(,"attempts":)" << result.attempts;
    if (result.execution.violated_capability) {
        oss << R"(,"capability":")" << to_string(*result.execution.violated_capability) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_retry(const TaskId& id, uint32_t attempt, std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"task_retry")"
        << R"(,"task":")" << json_escape(id) << "\""
        << R"(,"attempt":)" << attempt
        << R"(,"reason":")" << json_escape(reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_batch_summary(const Resultset& resultset, Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"batch_summary")"
        << R"(,"name":")" << json_escape(resultset.name) << "\""
        << R"(,"total":)" << resultset.size()
        << R"(,"passed":)" << resultset.number_passed()
        << R"(,"pass_rate":)" << resultset.pass_rate()
        << R"(,"duration_us":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace code_verdict
