#include "batchdl/rate_limiter.hpp"
#include "batchdl/errors.hpp"
#include "batchdl/logging.hpp"

#include <algorithm>
#include <cmath>

namespace batchdl {

namespace {
constexpr double kWindowMs = 1000.0;
} // namespace

RateLimiter::RateLimiter(std::int64_t bytes_per_second, Clock::time_point start)
    : bytes_per_second_(bytes_per_second), window_start_(start) {}

std::chrono::milliseconds RateLimiter::record(std::size_t bytes, Clock::time_point now) {
    return charge(bytes, now).delay;
}

RateLimiter::Charge RateLimiter::charge(std::size_t bytes, Clock::time_point now) {
    if (unlimited()) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const double elapsed_ms =
        std::chrono::duration<double, std::milli>(now - window_start_).count();
    if (elapsed_ms >= kWindowMs) {
        window_start_ = now;
        settled_ = recorded_;
        return {std::chrono::milliseconds{0}, recorded_};
    }

    recorded_ += bytes;
    const double ideal_ms =
        static_cast<double>(recorded_ - settled_) / static_cast<double>(bytes_per_second_) * kWindowMs;
    Charge result;
    result.mark = recorded_;
    if (ideal_ms > elapsed_ms) {
        result.delay = std::chrono::milliseconds{static_cast<std::int64_t>(std::ceil(ideal_ms - elapsed_ms))};
    }
    return result;
}

void RateLimiter::settle(std::uint64_t mark, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    settled_ = std::max(settled_, mark);
    window_start_ = now;
}

void RateLimiter::resetWindow(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    window_start_ = now;
    settled_ = recorded_;
}

void RateLimiter::throttle(std::size_t bytes, const CancellationToken& token) {
    const Charge charged = charge(bytes, Clock::now());
    if (charged.delay.count() == 0) {
        return;
    }

    logger()->trace("throttling for {} ms ({} B/s ceiling)", charged.delay.count(), bytes_per_second_);
    if (!token.waitFor(charged.delay)) {
        throw OperationCanceled("canceled while throttled");
    }
    settle(charged.mark, Clock::now());
}

std::uint64_t RateLimiter::bytesInWindow() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recorded_ - settled_;
}

} // namespace batchdl
