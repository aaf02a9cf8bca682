#pragma once

#include "cancellation.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace batchdl {

// Aggregate byte-rate ceiling shared by all workers of a run.
//
// Bytes are accounted in a one-second window. Each recorded chunk yields the
// delay needed for the window's bytes to fit the ceiling. A caller that
// waited settles only the bytes its delay paid for and restarts the window;
// bytes other workers recorded past that point stay charged. The window also
// restarts without delay, dropping everything, once a full second has
// elapsed, so short bursts above the ceiling are expected after an idle
// second.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    // `bytes_per_second` <= 0 disables throttling.
    explicit RateLimiter(std::int64_t bytes_per_second, Clock::time_point start = Clock::now());

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    [[nodiscard]] bool unlimited() const noexcept { return bytes_per_second_ <= 0; }

    // Records `bytes` and returns how long the caller must wait before
    // transferring more. Does not settle anything; see throttle().
    [[nodiscard]] std::chrono::milliseconds record(std::size_t bytes, Clock::time_point now = Clock::now());

    // Drops every outstanding byte and restarts the window at `now`.
    void resetWindow(Clock::time_point now = Clock::now());

    // Records `bytes`, waits out the delay, then settles the bytes that
    // delay covered. Throws OperationCanceled if the wait is interrupted.
    void throttle(std::size_t bytes, const CancellationToken& token);

    [[nodiscard]] std::uint64_t bytesInWindow() const;

private:
    struct Charge {
        std::chrono::milliseconds delay{0};
        // Value of recorded_ this charge was computed against.
        std::uint64_t mark{0};
    };

    Charge charge(std::size_t bytes, Clock::time_point now);
    void settle(std::uint64_t mark, Clock::time_point now);

    const std::int64_t bytes_per_second_;
    mutable std::mutex mutex_;
    Clock::time_point window_start_;
    // Monotonic totals; the window holds recorded_ - settled_ bytes.
    std::uint64_t recorded_{0};
    std::uint64_t settled_{0};
};

} // namespace batchdl
