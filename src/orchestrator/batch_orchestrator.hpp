/**
 * @file batch_orchestrator.hpp
 * @brief Fans a batch out across a worker pool and collects one TaskResult per item.
 * @author CodeVerdict contributors
 *
 * Workers report `Started` and `Finished` events for each attempt into a
 * CompletionQueue. The run loop is the only writer of the result slots, which
 * are keyed by input index, so results come back in input order whatever the
 * completion order.
 *
 * An attempt that outlives max_task_timeout is abandoned: its stop token is
 * signalled, a replacement worker is started and the retry is dispatched at
 * once. Jobs own copies of what they touch, so a worker stuck in an
 * abandoned attempt may outlive run(); the pool it belongs to is retired and
 * joined when the orchestrator is destroyed.
 *
 * Template-parameterized on the evaluator for testability (SandboxEvaluator in
 * production, scripted evaluators in tests).
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/worker_pool.hpp"
#include "orchestrator/completion_queue.hpp"
#include "telemetry/metrics_collector.hpp"
#include "verdict/resultset.hpp"
#include "verdict/verdict_collector.hpp"
#include "workload/batch.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace code_verdict {

struct OrchestratorOptions {
    size_t workers{0};                                   ///< 0 = hardware concurrency
    Duration max_task_timeout{std::chrono::seconds{60}}; ///< Per attempt, from its Started event
    uint32_t max_attempts{2};
};

/**
 * @brief One report from a worker about an attempt.
 *
 * @c outcome is set on Finished only.
 */
struct AttemptEvent {
    enum class Kind : uint8_t { Started, Finished };

    Kind kind{Kind::Started};
    size_t index{0};
    uint32_t attempt{1};
    SteadyTime at{};
    std::optional<Result<TaskResult>> outcome;
};

template <TaskEvaluatorLike EvaluatorT>
class BatchOrchestrator {
public:
    BatchOrchestrator(EvaluatorT& evaluator,
                      OrchestratorOptions options,
                      Logger& logger,
                      MetricsCollector& metrics);

    BatchOrchestrator(const BatchOrchestrator&) = delete;
    BatchOrchestrator& operator=(const BatchOrchestrator&) = delete;

    /**
     * @brief Evaluate every item of @p batch.
     *
     * Always returns exactly one TaskResult per item. Host-level failures are
     * retried up to max_attempts; the last failure becomes OrchestratorFailure.
     * Stopping @p stop ends the run early with "batch cancelled" for every
     * unfinished item.
     */
    [[nodiscard]] Resultset run(const Batch& batch, std::stop_token stop = {});

    [[nodiscard]] const OrchestratorOptions& options() const noexcept { return options_; }

private:
    struct AttemptSlot {
        uint32_t number{0};
        std::optional<SteadyTime> started;
        std::stop_source stop;
    };

    /// State of one run(); lives on run()'s stack. Jobs share only the event queue.
    struct RunState {
        const Batch& batch;
        std::shared_ptr<CompletionQueue<AttemptEvent>> events;
        std::vector<std::optional<TaskResult>> slots;
        std::vector<AttemptSlot> attempts;
        size_t remaining{0};
    };

    void dispatch(RunState& state, WorkerPool& pool, size_t index, uint32_t attempt);
    void complete(RunState& state, size_t index, TaskResult result);
    void fail_attempt(RunState& state, WorkerPool& pool, size_t index, const std::string& reason);
    [[nodiscard]] Result<TaskResult> evaluate_guarded(const BatchItem& item, std::stop_token stop);
    void retire(std::unique_ptr<WorkerPool> pool);

    static constexpr auto kPollInterval = std::chrono::milliseconds{50};

    EvaluatorT& evaluator_;
    OrchestratorOptions options_;
    Logger& logger_;
    MetricsCollector& metrics_;
    /// Pools that still had a worker inside an abandoned attempt when their run ended.
    std::vector<std::unique_ptr<WorkerPool>> retired_pools_;
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <TaskEvaluatorLike EvaluatorT>
BatchOrchestrator<EvaluatorT>::BatchOrchestrator(EvaluatorT& evaluator,
                                                 OrchestratorOptions options,
                                                 Logger& logger,
                                                 MetricsCollector& metrics)
    : evaluator_(evaluator)
    , options_(options)
    , logger_(logger)
    , metrics_(metrics) {
    if (options_.max_attempts == 0) options_.max_attempts = 1;
}

template <TaskEvaluatorLike EvaluatorT>
Resultset BatchOrchestrator<EvaluatorT>::run(const Batch& batch, std::stop_token stop) {
    const auto start_time = std::chrono::steady_clock::now();

    Resultset resultset;
    resultset.name = batch.name;
    resultset.version = batch.version;
    resultset.description = batch.description;

    RunState state{batch, std::make_shared<CompletionQueue<AttemptEvent>>(), {}, {}, batch.size()};
    state.slots.resize(batch.size());
    state.attempts.resize(batch.size());

    logger_.log(LogLevel::Info, "orchestrator",
                "Running batch '" + batch.name + "': " + std::to_string(batch.size()) + " tasks");

    {
        auto pool = std::make_unique<WorkerPool>(std::min(WorkerPool::resolve_thread_count(options_.workers),
                                                          std::max<size_t>(batch.size(), 1)));

        for (size_t index = 0; index < batch.size(); ++index) {
            dispatch(state, *pool, index, 1);
        }

        while (state.remaining > 0) {
            if (stop.stop_requested()) {
                for (size_t index = 0; index < batch.size(); ++index) {
                    if (state.slots[index]) continue;
                    state.attempts[index].stop.request_stop();
                    complete(state, index,
                             VerdictCollector::orchestrator_failure(batch.items[index].id,
                                                                    "batch cancelled",
                                                                    state.attempts[index].number));
                }
                logger_.log(LogLevel::Warn, "orchestrator", "Batch '" + batch.name + "' cancelled");
                break;
            }

            auto now = std::chrono::steady_clock::now();
            auto deadline = now + kPollInterval;
            for (size_t index = 0; index < batch.size(); ++index) {
                const auto& attempt = state.attempts[index];
                if (!state.slots[index] && attempt.started) {
                    deadline = std::min(deadline, *attempt.started + options_.max_task_timeout);
                }
            }

            if (auto event = state.events->pop_until(deadline)) {
                auto& attempt = state.attempts[event->index];
                const bool stale = state.slots[event->index].has_value()
                                || event->attempt != attempt.number;
                if (!stale) {
                    if (event->kind == AttemptEvent::Kind::Started) {
                        attempt.started = event->at;
                    } else if (event->outcome && event->outcome->has_value()) {
                        TaskResult result = std::move(*event->outcome).value();
                        result.task_id = batch.items[event->index].id;
                        result.attempts = event->attempt;
                        complete(state, event->index, std::move(result));
                    } else {
                        const std::string reason = event->outcome
                            ? event->outcome->error().describe()
                            : std::string{"attempt finished without an outcome"};
                        fail_attempt(state, *pool, event->index, reason);
                    }
                }
            }

            now = std::chrono::steady_clock::now();
            for (size_t index = 0; index < batch.size(); ++index) {
                auto& attempt = state.attempts[index];
                if (state.slots[index] || !attempt.started) continue;
                if (now - *attempt.started < options_.max_task_timeout) continue;
                attempt.stop.request_stop();
                pool->add_worker();
                fail_attempt(state, *pool, index,
                             "exceeded max task timeout of "
                             + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   options_.max_task_timeout).count())
                             + " ms");
            }
        }

        for (auto& attempt : state.attempts) attempt.stop.request_stop();
        retire(std::move(pool));
    }

    resultset.results.reserve(batch.size());
    for (auto& slot : state.slots) {
        resultset.results.push_back(std::move(*slot));
    }

    const auto elapsed = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start_time);
    metrics_.record_batch_summary(resultset, elapsed);
    metrics_.flush();
    logger_.log(LogLevel::Info, "orchestrator",
                "Batch '" + batch.name + "' finished: " + std::to_string(resultset.number_passed())
                + "/" + std::to_string(resultset.size()) + " passed");
    return resultset;
}

template <TaskEvaluatorLike EvaluatorT>
void BatchOrchestrator<EvaluatorT>::dispatch(RunState& state, WorkerPool& pool,
                                             size_t index, uint32_t attempt) {
    auto& slot = state.attempts[index];
    slot.number = attempt;
    slot.started.reset();
    slot.stop = std::stop_source{};

    pool.post([this, events = state.events, item = state.batch.items[index],
               index, attempt, token = slot.stop.get_token()](std::stop_token) {
        events->push(AttemptEvent{AttemptEvent::Kind::Started, index, attempt,
                                 std::chrono::steady_clock::now(), std::nullopt});
        Result<TaskResult> outcome = token.stop_requested()
            ? Result<TaskResult>{Error{ErrorCode::Cancelled, "attempt abandoned before it started"}}
            : evaluate_guarded(item, token);
        events->push(AttemptEvent{AttemptEvent::Kind::Finished, index, attempt,
                                 std::chrono::steady_clock::now(), std::move(outcome)});
    });
}

template <TaskEvaluatorLike EvaluatorT>
Result<TaskResult> BatchOrchestrator<EvaluatorT>::evaluate_guarded(const BatchItem& item,
                                                                   std::stop_token stop) {
    try {
        return evaluator_.evaluate(item, stop);
    } catch (const std::exception& ex) {
        return Error{ErrorCode::Internal, std::string{"evaluator threw: "} + ex.what()};
    }
}

template <TaskEvaluatorLike EvaluatorT>
void BatchOrchestrator<EvaluatorT>::retire(std::unique_ptr<WorkerPool> pool) {
    std::erase_if(retired_pools_, [](const auto& retired) { return retired->active_count() == 0; });
    pool->request_stop();
    if (pool->active_count() == 0) return;  // joins idle workers here

    logger_.log(LogLevel::Warn, "orchestrator",
                std::to_string(pool->active_count())
                + " worker(s) still inside abandoned attempts; joined at shutdown");
    retired_pools_.push_back(std::move(pool));
}

template <TaskEvaluatorLike EvaluatorT>
void BatchOrchestrator<EvaluatorT>::complete(RunState& state, size_t index, TaskResult result) {
    metrics_.record_task_result(result);
    logger_.log(LogLevel::Debug, "orchestrator",
                "Task '" + result.task_id + "' -> " + std::string{to_string(result.execution.terminal)}
                + (result.passed ? " (passed)" : " (failed)"));
    state.slots[index] = std::move(result);
    --state.remaining;
}

template <TaskEvaluatorLike EvaluatorT>
void BatchOrchestrator<EvaluatorT>::fail_attempt(RunState& state, WorkerPool& pool,
                                                 size_t index, const std::string& reason) {
    const auto& id = state.batch.items[index].id;
    const uint32_t attempt = state.attempts[index].number;
    logger_.log(LogLevel::Warn, "orchestrator",
                "Task '" + id + "' attempt " + std::to_string(attempt) + " failed: " + reason);

    if (attempt < options_.max_attempts) {
        metrics_.record_retry(id, attempt + 1, reason);
        dispatch(state, pool, index, attempt + 1);
        return;
    }
    complete(state, index, VerdictCollector::orchestrator_failure(id, reason, attempt));
}

}  // namespace code_verdict
