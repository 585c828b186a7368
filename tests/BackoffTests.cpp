#include <gtest/gtest.h>

#include "client/backoff.hpp"

using namespace fl::client;

TEST(BackoffTests, StartsAtInitialDelay) {
    ReconnectBackoff backoff;
    EXPECT_EQ(backoff.next(), kInitialBackoffMs);
}

TEST(BackoffTests, GrowsMonotonicallyAndCaps) {
    ReconnectBackoff backoff;
    int previous = 0;
    for (int i = 0; i < 20; ++i) {
        const int delay = backoff.next(kFailureMultiplier);
        SCOPED_TRACE("Attempt " + std::to_string(i));
        EXPECT_GE(delay, previous);
        EXPECT_LE(delay, kMaxBackoffMs);
        previous = delay;
    }
    EXPECT_EQ(previous, kMaxBackoffMs);
}

TEST(BackoffTests, FailureSequence) {
    ReconnectBackoff backoff;
    const int expected[] = {500, 850, 1445, 2457, 4177, 5000, 5000};
    for (const int delay : expected) {
        EXPECT_EQ(backoff.next(kFailureMultiplier), delay);
    }
}

TEST(BackoffTests, DropsGrowSlower) {
    ReconnectBackoff backoff;
    EXPECT_EQ(backoff.next(kDropMultiplier), 500);
    EXPECT_EQ(backoff.next(kDropMultiplier), 750);
    EXPECT_EQ(backoff.next(kDropMultiplier), 1125);
}

TEST(BackoffTests, ResetsAfterSuccess) {
    ReconnectBackoff backoff;
    for (int i = 0; i < 5; ++i) {
        backoff.next();
    }
    EXPECT_GT(backoff.currentMs(), kInitialBackoffMs);

    backoff.reset();
    EXPECT_EQ(backoff.next(), kInitialBackoffMs);
}

TEST(BackoffTests, MultiplierBelowOneDoesNotShrink) {
    ReconnectBackoff backoff(1000, 4000);
    backoff.next(0.5);
    EXPECT_EQ(backoff.currentMs(), 1000);
}
