/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for WorkerPool.
 * @author CodeVerdict contributors
 */

#include "executor/worker_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace code_verdict;

namespace {

/// Blocks until @p expected jobs have called arrive().
class Latch {
public:
    explicit Latch(size_t expected) : remaining_(expected) {}

    void arrive() {
        std::lock_guard lock(mutex_);
        if (remaining_ > 0 && --remaining_ == 0) cv_.notify_all();
    }

    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return remaining_ == 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    size_t remaining_;
};

}  // namespace

TEST(WorkerPoolTest, RunsEveryPostedJob) {
    WorkerPool pool(4);
    std::atomic<int> counter{0};
    Latch done(100);

    for (int i = 0; i < 100; ++i) {
        pool.post([&](std::stop_token) {
            counter.fetch_add(1, std::memory_order_relaxed);
            done.arrive();
        });
    }

    ASSERT_TRUE(done.wait_for(std::chrono::seconds(5)));
    EXPECT_EQ(counter.load(), 100);
}

TEST(WorkerPoolTest, ThreadCount) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(WorkerPoolTest, ZeroMeansHardwareConcurrency) {
    EXPECT_GE(WorkerPool::resolve_thread_count(0), 1u);
    EXPECT_EQ(WorkerPool::resolve_thread_count(7), 7u);
}

TEST(WorkerPoolTest, JobsRunConcurrently) {
    WorkerPool pool(2);
    Latch both_running(2);
    Latch done(2);

    for (int i = 0; i < 2; ++i) {
        pool.post([&](std::stop_token) {
            both_running.arrive();
            // Only returns if the other job is running at the same time.
            both_running.wait_for(std::chrono::seconds(5));
            done.arrive();
        });
    }
    EXPECT_TRUE(done.wait_for(std::chrono::seconds(5)));
}

TEST(WorkerPoolTest, DestructorStopsRunningJobs) {
    std::atomic<bool> observed_stop{false};
    Latch started(1);
    {
        WorkerPool pool(1);
        pool.post([&](std::stop_token stop) {
            started.arrive();
            while (!stop.stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            observed_stop = true;
        });
        ASSERT_TRUE(started.wait_for(std::chrono::seconds(5)));
    }
    EXPECT_TRUE(observed_stop.load());
}

TEST(WorkerPoolTest, QueuedCountWhileBusy) {
    WorkerPool pool(1);
    std::atomic<bool> release{false};
    Latch started(1);

    pool.post([&](std::stop_token) {
        started.arrive();
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    });
    ASSERT_TRUE(started.wait_for(std::chrono::seconds(5)));
    pool.post([](std::stop_token) {});

    EXPECT_EQ(pool.active_count(), 1u);
    EXPECT_EQ(pool.queued_count(), 1u);
    release = true;
}

TEST(WorkerPoolTest, AddedWorkerServesQueueBehindStuckJob) {
    WorkerPool pool(1);
    std::atomic<bool> release{false};
    Latch started(1);
    Latch served(1);

    pool.post([&](std::stop_token) {
        started.arrive();
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    });
    ASSERT_TRUE(started.wait_for(std::chrono::seconds(5)));

    pool.post([&](std::stop_token) { served.arrive(); });
    pool.add_worker();
    EXPECT_TRUE(served.wait_for(std::chrono::seconds(5)));
    EXPECT_EQ(pool.thread_count(), 2u);
    release = true;
}

TEST(WorkerPoolTest, RequestStopDropsQueuedJobsWithoutJoining) {
    WorkerPool pool(1);
    std::atomic<bool> release{false};
    std::atomic<bool> dropped_ran{false};
    Latch started(1);

    pool.post([&](std::stop_token) {
        started.arrive();
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    });
    ASSERT_TRUE(started.wait_for(std::chrono::seconds(5)));
    pool.post([&](std::stop_token) { dropped_ran = true; });

    pool.request_stop();
    EXPECT_EQ(pool.queued_count(), 0u);
    EXPECT_EQ(pool.active_count(), 1u);
    release = true;
    EXPECT_FALSE(dropped_ran.load());
}
