/**
 * @file test_completion_queue.cpp
 * @brief Unit tests for CompletionQueue.
 * @author CodeVerdict contributors
 */

#include "orchestrator/completion_queue.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <vector>

using namespace code_verdict;

TEST(CompletionQueueTest, FifoOrder) {
    CompletionQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.push(3);
    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.try_pop(), 1);
    EXPECT_EQ(queue.try_pop(), 2);
    EXPECT_EQ(queue.try_pop(), 3);
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(CompletionQueueTest, PopUntilTimesOutWhenEmpty) {
    CompletionQueue<int> queue;
    const auto start = std::chrono::steady_clock::now();
    auto event = queue.pop_until(start + std::chrono::milliseconds(50));
    EXPECT_FALSE(event.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

TEST(CompletionQueueTest, PopUntilWakesOnPush) {
    CompletionQueue<std::string> queue;
    std::jthread producer([&queue] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.push("finished");
    });

    auto event = queue.pop_until(std::chrono::steady_clock::now() + std::chrono::seconds(5));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(*event, "finished");
}

TEST(CompletionQueueTest, ManyProducersSingleConsumer) {
    CompletionQueue<int> queue;
    {
        std::vector<std::jthread> producers;
        for (int p = 0; p < 4; ++p) {
            producers.emplace_back([&queue, p] {
                for (int i = 0; i < 250; ++i) queue.push(p * 1000 + i);
            });
        }
    }

    size_t received = 0;
    while (queue.pop_until(std::chrono::steady_clock::now() + std::chrono::milliseconds(10))) {
        ++received;
    }
    EXPECT_EQ(received, 1000u);
}
