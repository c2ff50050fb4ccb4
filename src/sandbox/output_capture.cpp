/**
 * @file output_capture.cpp
 * @brief BoundedBuffer and stream pump implementation.
 * @author CodeVerdict contributors
 */

#include "sandbox/output_capture.hpp"
#include "core/text.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>

namespace code_verdict {

namespace {

constexpr int kPollIntervalMs = 50;
constexpr size_t kReadChunk = 64 * 1024;

/// Returns false once the descriptor reached EOF or failed.
bool read_available(StreamTarget& target) {
    std::array<char, kReadChunk> chunk{};
    while (true) {
        ssize_t n = ::read(target.fd, chunk.data(), chunk.size());
        if (n > 0) {
            target.buffer->append(std::string_view{chunk.data(), static_cast<size_t>(n)});
            if (static_cast<size_t>(n) < chunk.size()) return true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

}  // namespace

// ── BoundedBuffer ────────────────────────────

void BoundedBuffer::append(std::string_view chunk) {
    if (dropped_ > 0) {
        dropped_ += chunk.size();
        return;
    }
    const uint64_t room = cap_ > data_.size() ? cap_ - data_.size() : 0;
    if (chunk.size() <= room) {
        data_.append(chunk);
        return;
    }
    // Cut on a character boundary so the kept prefix stays decodable.
    std::string combined = data_;
    combined.append(chunk.substr(0, static_cast<size_t>(room) + 3 < chunk.size()
                                        ? static_cast<size_t>(room) + 3 : chunk.size()));
    size_t keep = utf8_safe_prefix(combined, static_cast<size_t>(cap_));
    keep = std::max(keep, data_.size());
    const size_t taken = keep - data_.size();
    data_.append(chunk.substr(0, taken));
    dropped_ = chunk.size() - taken;
}

std::string BoundedBuffer::text() const {
    std::string out = sanitize_utf8(data_);
    if (truncated()) out += truncation_marker(dropped_);
    return out;
}

std::string truncation_marker(uint64_t dropped_bytes) {
    return "\n...[truncated " + std::to_string(dropped_bytes) + " bytes]";
}

// ── pump_streams ─────────────────────────────

void pump_streams(std::vector<StreamTarget> targets, std::stop_token stop) {
    for (auto& target : targets) {
        int flags = ::fcntl(target.fd, F_GETFL);
        if (flags >= 0) ::fcntl(target.fd, F_SETFL, flags | O_NONBLOCK);
    }

    std::vector<StreamTarget> open = std::move(targets);
    while (!open.empty() && !stop.stop_requested()) {
        std::vector<pollfd> fds;
        fds.reserve(open.size());
        for (const auto& target : open) {
            fds.push_back(pollfd{.fd = target.fd, .events = POLLIN, .revents = 0});
        }

        int ready = ::poll(fds.data(), fds.size(), kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        std::vector<StreamTarget> still_open;
        for (size_t i = 0; i < open.size(); ++i) {
            if (fds[i].revents == 0) {
                still_open.push_back(open[i]);
                continue;
            }
            if (read_available(open[i])) still_open.push_back(open[i]);
        }
        open = std::move(still_open);
    }

    // Final non-blocking drain of whatever the writers left behind.
    for (auto& target : open) {
        while (read_available(target)) {
            pollfd pfd{.fd = target.fd, .events = POLLIN, .revents = 0};
            if (::poll(&pfd, 1, 0) <= 0) break;
        }
    }
}

}  // namespace code_verdict
