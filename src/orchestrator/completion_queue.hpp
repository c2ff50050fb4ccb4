/**
 * @file completion_queue.hpp
 * @brief Synchronized FIFO through which workers report to a single consumer.
 * @author CodeVerdict contributors
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace code_verdict {

/**
 * @brief Multi-producer, single-consumer event queue.
 *
 * Producers never block on the consumer; the consumer waits with a deadline
 * so it can enforce timeouts between events.
 */
template <typename Event>
class CompletionQueue {
public:
    void push(Event event) {
        {
            std::lock_guard lock(mutex_);
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    /// Next event, or nullopt if none arrived before @p deadline.
    template <typename Clock, typename Dur>
    [[nodiscard]] std::optional<Event> pop_until(std::chrono::time_point<Clock, Dur> deadline) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_until(lock, deadline, [this] { return !events_.empty(); })) {
            return std::nullopt;
        }
        Event event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    [[nodiscard]] std::optional<Event> try_pop() {
        std::lock_guard lock(mutex_);
        if (events_.empty()) return std::nullopt;
        Event event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return events_.size();
    }

private:
    std::deque<Event> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace code_verdict
