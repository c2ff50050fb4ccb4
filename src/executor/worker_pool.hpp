/**
 * @file worker_pool.hpp
 * @brief std::jthread-based worker pool with cooperative cancellation.
 * @author CodeVerdict contributors
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace code_verdict {

/**
 * @brief Fixed set of workers, each running one job to completion.
 *
 * Jobs receive the worker's stop_token. Destruction requests stop, wakes all
 * workers and joins them; jobs still queued at that point are dropped.
 * A job that never returns pins its worker; add_worker() puts a replacement
 * in service, and the owner decides how long to keep the pool (and thus the
 * stuck thread) alive.
 */
class WorkerPool {
public:
    using Job = std::function<void(std::stop_token)>;

    /// @param num_threads 0 selects std::thread::hardware_concurrency().
    explicit WorkerPool(size_t num_threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void post(Job job);

    /// Start one more worker. Not thread-safe with respect to other add_worker() calls.
    void add_worker();

    /// Stop taking jobs and drop the queue without joining; running jobs keep running.
    void request_stop() noexcept;

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

    /// Worker count a request for @p requested threads resolves to.
    [[nodiscard]] static size_t resolve_thread_count(size_t requested) noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_jobs_{0};
    std::vector<std::jthread> workers_;
};

}  // namespace code_verdict
