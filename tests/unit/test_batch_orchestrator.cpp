/**
 * @file test_batch_orchestrator.cpp
 * @brief Unit tests for BatchOrchestrator with scripted evaluators.
 * @author CodeVerdict contributors
 */

#include "orchestrator/batch_orchestrator.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace code_verdict;

namespace {

/// Keeps every line written to it.
class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines) : lines_(std::move(lines)) {}
    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

TaskResult passing_result(const TaskId& id) {
    TaskResult result;
    result.task_id = id;
    result.execution.terminal = TerminalState::Success;
    result.passed = true;
    return result;
}

Batch make_batch(size_t count) {
    Batch batch;
    batch.name = "unit";
    batch.version = "1";
    for (size_t i = 0; i < count; ++i) {
        batch.items.push_back(BatchItem{"task-" + std::to_string(i), "x = 1", {"x == 1"}});
    }
    return batch;
}

/// Finishes later items first so completion order is the reverse of input order.
struct ReverseOrderEvaluator {
    size_t count;

    Result<TaskResult> evaluate(const BatchItem& item, std::stop_token) {
        const auto index = std::stoul(item.id.substr(item.id.find('-') + 1));
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (count - index)));
        return passing_result(item.id);
    }
};

/// Fails the first attempt of every item with a host-level error.
struct FlakyEvaluator {
    std::mutex mutex;
    std::map<TaskId, int> calls;

    Result<TaskResult> evaluate(const BatchItem& item, std::stop_token) {
        std::lock_guard lock(mutex);
        if (calls[item.id]++ == 0) return Error{ErrorCode::Sandbox, "fork failed"};
        return passing_result(item.id);
    }
};

struct AlwaysFailingEvaluator {
    std::atomic<int> calls{0};

    Result<TaskResult> evaluate(const BatchItem&, std::stop_token) {
        ++calls;
        return Error{ErrorCode::Io, "scratch root is read-only"};
    }
};

struct ThrowingEvaluator {
    Result<TaskResult> evaluate(const BatchItem&, std::stop_token) {
        throw std::runtime_error("boom");
    }
};

/// Blocks until its stop_token is signalled.
struct HangingEvaluator {
    std::atomic<int> calls{0};
    std::atomic<int> stopped{0};

    Result<TaskResult> evaluate(const BatchItem&, std::stop_token stop) {
        ++calls;
        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock lock(mutex);
        cv.wait(lock, stop, [] { return false; });
        ++stopped;
        return Error{ErrorCode::Cancelled, "stopped"};
    }
};

/// Item "stuck" sleeps through its stop token; everything else passes at once.
struct StubbornEvaluator {
    std::atomic<int> stuck_calls{0};

    Result<TaskResult> evaluate(const BatchItem& item, std::stop_token) {
        if (item.id != "stuck") return passing_result(item.id);
        ++stuck_calls;
        std::this_thread::sleep_for(std::chrono::seconds(2));
        return passing_result(item.id);
    }
};

class BatchOrchestratorTest : public ::testing::Test {
protected:
    std::shared_ptr<std::vector<std::string>> metric_lines_ = std::make_shared<std::vector<std::string>>();
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Debug};
    MetricsCollector metrics_{std::make_unique<CaptureSink>(metric_lines_)};

    size_t count_events(std::string_view event) const {
        const std::string needle = R"({"event":")" + std::string{event} + "\"";
        size_t n = 0;
        for (const auto& line : *metric_lines_) {
            if (line.rfind(needle, 0) == 0) ++n;
        }
        return n;
    }
};

}  // namespace

TEST_F(BatchOrchestratorTest, PreservesInputOrder) {
    auto batch = make_batch(6);
    ReverseOrderEvaluator evaluator{batch.size()};
    BatchOrchestrator orchestrator(evaluator, OrchestratorOptions{.workers = 6}, logger_, metrics_);

    auto resultset = orchestrator.run(batch);
    EXPECT_EQ(resultset.name, "unit");
    EXPECT_EQ(resultset.version, "1");
    ASSERT_EQ(resultset.size(), batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        EXPECT_EQ(resultset.results[i].task_id, batch.items[i].id);
        EXPECT_TRUE(resultset.results[i].passed);
        EXPECT_EQ(resultset.results[i].attempts, 1u);
    }
    EXPECT_EQ(count_events("task_result"), 6u);
    EXPECT_EQ(count_events("batch_summary"), 1u);
}

TEST_F(BatchOrchestratorTest, EmptyBatch) {
    ReverseOrderEvaluator evaluator{0};
    BatchOrchestrator orchestrator(evaluator, OrchestratorOptions{}, logger_, metrics_);

    auto resultset = orchestrator.run(make_batch(0));
    EXPECT_EQ(resultset.size(), 0u);
    EXPECT_EQ(count_events("batch_summary"), 1u);
}

TEST_F(BatchOrchestratorTest, RetriesHostFailureOnce) {
    auto batch = make_batch(3);
    FlakyEvaluator evaluator;
    BatchOrchestrator orchestrator(evaluator, OrchestratorOptions{.workers = 2}, logger_, metrics_);

    auto resultset = orchestrator.run(batch);
    ASSERT_EQ(resultset.size(), 3u);
    for (const auto& result : resultset.results) {
        EXPECT_TRUE(result.passed);
        EXPECT_EQ(result.attempts, 2u);
    }
    EXPECT_EQ(count_events("task_retry"), 3u);
}

TEST_F(BatchOrchestratorTest, SecondFailureBecomesOrchestratorFailure) {
    auto batch = make_batch(2);
    AlwaysFailingEvaluator evaluator;
    BatchOrchestrator orchestrator(evaluator, OrchestratorOptions{.workers = 2}, logger_, metrics_);

    auto resultset = orchestrator.run(batch);
    ASSERT_EQ(resultset.size(), 2u);
    for (size_t i = 0; i < batch.size(); ++i) {
        const auto& result = resultset.results[i];
        EXPECT_EQ(result.task_id, batch.items[i].id);
        EXPECT_EQ(result.execution.terminal, TerminalState::OrchestratorFailure);
        EXPECT_EQ(result.execution.message, "io: scratch root is read-only");
        EXPECT_EQ(result.attempts, 2u);
        EXPECT_FALSE(result.passed);
        EXPECT_TRUE(result.outcomes.empty());
    }
    EXPECT_EQ(evaluator.calls.load(), 4);
}

TEST_F(BatchOrchestratorTest, MaxAttemptsOfOneDisablesRetry) {
    AlwaysFailingEvaluator evaluator;
    BatchOrchestrator orchestrator(evaluator, OrchestratorOptions{.workers = 1, .max_attempts = 1},
                                   logger_, metrics_);

    auto resultset = orchestrator.run(make_batch(1));
    ASSERT_EQ(resultset.size(), 1u);
    EXPECT_EQ(resultset.results[0].attempts, 1u);
    EXPECT_EQ(evaluator.calls.load(), 1);
    EXPECT_EQ(count_events("task_retry"), 0u);
}

TEST_F(BatchOrchestratorTest, EscapedExceptionIsHostFailure) {
    ThrowingEvaluator evaluator;
    BatchOrchestrator orchestrator(evaluator, OrchestratorOptions{.workers = 1}, logger_, metrics_);

    auto resultset = orchestrator.run(make_batch(1));
    ASSERT_EQ(resultset.size(), 1u);
    const auto& result = resultset.results[0];
    EXPECT_EQ(result.execution.terminal, TerminalState::OrchestratorFailure);
    EXPECT_NE(result.execution.message.find("boom"), std::string::npos);
    EXPECT_EQ(result.attempts, 2u);
}

TEST_F(BatchOrchestratorTest, MaxTaskTimeoutStopsAndAbandonsAttempts) {
    HangingEvaluator evaluator;
    std::chrono::steady_clock::duration elapsed{};
    Resultset resultset;
    {
        BatchOrchestrator orchestrator(
            evaluator,
            OrchestratorOptions{.workers = 2, .max_task_timeout = std::chrono::milliseconds{100}},
            logger_, metrics_);

        const auto start = std::chrono::steady_clock::now();
        resultset = orchestrator.run(make_batch(1));
        elapsed = std::chrono::steady_clock::now() - start;
    }

    ASSERT_EQ(resultset.size(), 1u);
    const auto& result = resultset.results[0];
    EXPECT_EQ(result.execution.terminal, TerminalState::OrchestratorFailure);
    EXPECT_EQ(result.execution.message, "exceeded max task timeout of 100 ms");
    EXPECT_EQ(result.attempts, 2u);
    EXPECT_EQ(evaluator.calls.load(), 2);
    EXPECT_EQ(evaluator.stopped.load(), 2);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(BatchOrchestratorTest, StuckEvaluatorDoesNotHoldUpTheRun) {
    StubbornEvaluator evaluator;
    std::chrono::steady_clock::duration elapsed{};
    Resultset resultset;
    {
        BatchOrchestrator orchestrator(
            evaluator,
            OrchestratorOptions{.workers = 2, .max_task_timeout = std::chrono::milliseconds{100}},
            logger_, metrics_);

        Batch batch = make_batch(3);
        batch.items[0].id = "stuck";
        const auto start = std::chrono::steady_clock::now();
        resultset = orchestrator.run(batch);
        elapsed = std::chrono::steady_clock::now() - start;
    }

    // Two 100 ms attempts plus polling; nowhere near the 2 s the stuck calls take.
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
    ASSERT_EQ(resultset.size(), 3u);
    EXPECT_EQ(resultset.results[0].task_id, "stuck");
    EXPECT_EQ(resultset.results[0].execution.terminal, TerminalState::OrchestratorFailure);
    EXPECT_EQ(resultset.results[0].attempts, 2u);
    EXPECT_TRUE(resultset.results[1].passed);
    EXPECT_TRUE(resultset.results[2].passed);
    EXPECT_EQ(evaluator.stuck_calls.load(), 2);
}

TEST_F(BatchOrchestratorTest, BatchStopCancelsUnfinishedItems) {
    HangingEvaluator evaluator;
    BatchOrchestrator orchestrator(evaluator, OrchestratorOptions{.workers = 2}, logger_, metrics_);

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stop.request_stop();
    });

    auto resultset = orchestrator.run(make_batch(3), stop.get_token());
    ASSERT_EQ(resultset.size(), 3u);
    for (const auto& result : resultset.results) {
        EXPECT_EQ(result.execution.terminal, TerminalState::OrchestratorFailure);
        EXPECT_EQ(result.execution.message, "batch cancelled");
    }
}
