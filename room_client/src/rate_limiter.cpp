/**
 * @file rate_limiter.cpp
 * @brief 发送频率限制器实现
 */

#include "room_client/rate_limiter.hpp"

#include <algorithm>

namespace huddle::client {

RateLimiter::RateLimiter(int max_rate_hz)
    : max_rate_hz_(max_rate_hz)
{
    set_max_rate(max_rate_hz);
}

bool RateLimiter::should_publish(Clock::time_point now) {
    if (!has_published_ || now - last_publish_ >= min_interval_) {
        last_publish_ = now;
        has_published_ = true;
        ++publish_count_;
        return true;
    }
    return false;
}

RateLimiter::Clock::duration RateLimiter::time_until_next(Clock::time_point now) const {
    if (!has_published_) {
        return Clock::duration::zero();
    }
    auto elapsed = now - last_publish_;
    if (elapsed >= min_interval_) {
        return Clock::duration::zero();
    }
    return std::chrono::duration_cast<Clock::duration>(min_interval_) - elapsed;
}

void RateLimiter::set_max_rate(int hz) {
    max_rate_hz_ = std::max(1, hz);
    min_interval_ = std::chrono::microseconds(1000000 / max_rate_hz_);
}

void RateLimiter::reset() {
    has_published_ = false;
    publish_count_ = 0;
}

} // namespace huddle::client
