#include "common/rate_limiter.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace arena;

TEST(RateLimiterTest, LimitsRequestsPerWindow) {
    rate_limiter limiter(100, 1000, 3);
    EXPECT_TRUE(limiter.try_acquire("10.0.0.1", 0));
    EXPECT_TRUE(limiter.try_acquire("10.0.0.1", 10));
    EXPECT_TRUE(limiter.try_acquire("10.0.0.1", 20));
    EXPECT_FALSE(limiter.try_acquire("10.0.0.1", 30));
    EXPECT_TRUE(limiter.try_acquire("10.0.0.2", 30));

    // 新的窗口重新计数
    EXPECT_TRUE(limiter.try_acquire("10.0.0.1", 1000));
}

TEST(RateLimiterTest, ExpiredEntriesAreEvicted) {
    rate_limiter limiter(100, 1000, 3);
    limiter.try_acquire("a", 0);
    limiter.try_acquire("b", 500);
    EXPECT_EQ(limiter.size(), 2u);

    limiter.try_acquire("c", 1200);
    EXPECT_EQ(limiter.size(), 2u);
    limiter.try_acquire("d", 5000);
    EXPECT_EQ(limiter.size(), 1u);
}

TEST(RateLimiterTest, CapacityIsBounded) {
    rate_limiter limiter(2, 60000, 1);
    EXPECT_TRUE(limiter.try_acquire("a", 0));
    EXPECT_TRUE(limiter.try_acquire("b", 1));
    EXPECT_TRUE(limiter.try_acquire("c", 2));
    EXPECT_EQ(limiter.size(), 2u);

    // a 被淘汰之后重新计数
    EXPECT_TRUE(limiter.try_acquire("a", 3));
    EXPECT_FALSE(limiter.try_acquire("c", 4));
}

TEST(RateLimiterTest, ZeroLimitRejectsEverything) {
    rate_limiter limiter(10, 1000, 0);
    EXPECT_FALSE(limiter.try_acquire("a", 0));
    EXPECT_FALSE(limiter.try_acquire("a", 1));
}
