/**
 * @file rate_limiter_test.cpp
 * @brief 发送频率限制测试
 */

#include "room_client/rate_limiter.hpp"

#include <gtest/gtest.h>

using namespace huddle::client;
using namespace std::chrono_literals;

TEST(RateLimiterTest, FirstCallPasses) {
    RateLimiter limiter(10);
    EXPECT_TRUE(limiter.should_publish(RateLimiter::Clock::now()));
    EXPECT_EQ(limiter.publish_count(), 1);
}

TEST(RateLimiterTest, EnforcesMinimumInterval) {
    RateLimiter limiter(10);
    auto t0 = RateLimiter::Clock::now();
    ASSERT_TRUE(limiter.should_publish(t0));
    EXPECT_FALSE(limiter.should_publish(t0 + 50ms));
    EXPECT_FALSE(limiter.should_publish(t0 + 99ms));
    EXPECT_TRUE(limiter.should_publish(t0 + 100ms));
    EXPECT_EQ(limiter.publish_count(), 2);
}

TEST(RateLimiterTest, TimeUntilNext) {
    RateLimiter limiter(10);
    auto t0 = RateLimiter::Clock::now();
    EXPECT_EQ(limiter.time_until_next(t0), RateLimiter::Clock::duration::zero());
    limiter.should_publish(t0);
    EXPECT_EQ(limiter.time_until_next(t0 + 30ms), std::chrono::duration_cast<RateLimiter::Clock::duration>(70ms));
    EXPECT_EQ(limiter.time_until_next(t0 + 150ms), RateLimiter::Clock::duration::zero());
}

TEST(RateLimiterTest, NonPositiveRateIsClamped) {
    RateLimiter limiter(0);
    EXPECT_EQ(limiter.max_rate(), 1);
    auto t0 = RateLimiter::Clock::now();
    limiter.should_publish(t0);
    EXPECT_FALSE(limiter.should_publish(t0 + 999ms));
    EXPECT_TRUE(limiter.should_publish(t0 + 1s));
}

TEST(RateLimiterTest, ResetAllowsImmediatePublish) {
    RateLimiter limiter(1);
    auto t0 = RateLimiter::Clock::now();
    limiter.should_publish(t0);
    limiter.reset();
    EXPECT_TRUE(limiter.should_publish(t0 + 1ms));
    EXPECT_EQ(limiter.publish_count(), 1);
}
