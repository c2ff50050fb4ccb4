/**
 * @file output_capture.hpp
 * @brief Bounded capture of the sandboxed process's output streams.
 * @author CodeVerdict contributors
 */

#pragma once

#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace code_verdict {

/**
 * @brief Keeps at most @c cap bytes and counts everything dropped past it.
 *
 * Memory use stays bounded no matter how much a runaway process writes.
 */
class BoundedBuffer {
public:
    explicit BoundedBuffer(uint64_t cap) : cap_(cap) {}

    void append(std::string_view chunk);

    [[nodiscard]] bool truncated() const noexcept { return dropped_ > 0; }
    [[nodiscard]] uint64_t dropped() const noexcept { return dropped_; }
    [[nodiscard]] const std::string& raw() const noexcept { return data_; }

    /**
     * @brief Sanitized UTF-8 text, with "\n...[truncated N bytes]" appended when
     *        anything was dropped.
     */
    [[nodiscard]] std::string text() const;

private:
    uint64_t cap_;
    std::string data_;
    uint64_t dropped_{0};
};

/// Marker appended to truncated streams.
[[nodiscard]] std::string truncation_marker(uint64_t dropped_bytes);

struct StreamTarget {
    int fd;
    BoundedBuffer* buffer;
};

/**
 * @brief Read every target until all reach EOF, or until @p stop is requested.
 *
 * After a stop request whatever is still buffered in the pipes is drained
 * without blocking, then the function returns.
 */
void pump_streams(std::vector<StreamTarget> targets, std::stop_token stop);

}  // namespace code_verdict
