/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 * @author CodeVerdict contributors
 */

#include "executor/worker_pool.hpp"

namespace code_verdict {

size_t WorkerPool::resolve_thread_count(size_t requested) noexcept {
    if (requested != 0) return requested;
    const size_t hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 4 : hardware;
}

WorkerPool::WorkerPool(size_t num_threads) {
    num_threads = resolve_thread_count(num_threads);
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        add_worker();
    }
}

WorkerPool::~WorkerPool() {
    request_stop();
    workers_.clear();
}

void WorkerPool::add_worker() {
    workers_.emplace_back([this](std::stop_token stop) {
        worker_loop(stop);
    });
}

void WorkerPool::request_stop() noexcept {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    {
        std::lock_guard lock(queue_mutex_);
        job_queue_ = {};
    }
    queue_cv_.notify_all();
}

void WorkerPool::post(Job job) {
    {
        std::lock_guard lock(queue_mutex_);
        job_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
}

void WorkerPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        Job job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !job_queue_.empty(); });

            if (stop.stop_requested()) return;
            if (job_queue_.empty()) continue;

            job = std::move(job_queue_.front());
            job_queue_.pop();
        }

        ++active_jobs_;
        job(stop);
        --active_jobs_;
    }
}

size_t WorkerPool::active_count() const noexcept {
    return active_jobs_.load();
}

size_t WorkerPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return job_queue_.size();
}

size_t WorkerPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace code_verdict
