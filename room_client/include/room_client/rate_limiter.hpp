/**
 * @file rate_limiter.hpp
 * @brief 发送频率限制器
 */

#pragma once

#include <chrono>

namespace huddle::client {

/**
 * @brief 单通道频率限制器
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief 构造函数
     * @param max_rate_hz 最大发送频率 (Hz)
     */
    explicit RateLimiter(int max_rate_hz = 10);

    /**
     * @brief 检查当前是否可以发送，可以则记为已发送
     */
    bool should_publish(Clock::time_point now = Clock::now());

    /**
     * @brief 距离下一次允许发送的时间
     */
    Clock::duration time_until_next(Clock::time_point now = Clock::now()) const;

    /**
     * @brief 设置最大频率
     */
    void set_max_rate(int hz);
    int max_rate() const { return max_rate_hz_; }

    int publish_count() const { return publish_count_; }

    /**
     * @brief 重置（下一次调用立即放行）
     */
    void reset();

private:
    int max_rate_hz_;
    std::chrono::microseconds min_interval_;
    Clock::time_point last_publish_;
    bool has_published_ = false;
    int publish_count_ = 0;
};

} // namespace huddle::client
