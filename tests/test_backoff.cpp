#include <gtest/gtest.h>
#include <thread>
#include "backoff.hpp"
#include "cancellation.hpp"

TEST(BackoffTest, GrowsExponentiallyWithoutJitter) {
    BackoffConfig cfg{100, 10000, 2.0, 0.0};
    Backoff b(cfg, 1);
    EXPECT_EQ(b.next().count(), 100);
    EXPECT_EQ(b.next().count(), 200);
    EXPECT_EQ(b.next().count(), 400);
    EXPECT_EQ(b.next().count(), 800);
    EXPECT_EQ(b.attempts(), 4);
}

TEST(BackoffTest, CapsAtMax) {
    BackoffConfig cfg{100, 500, 3.0, 0.0};
    Backoff b(cfg, 1);
    b.next();
    b.next();
    for (int i = 0; i < 50; ++i) EXPECT_EQ(b.next().count(), 500);
}

TEST(BackoffTest, JitterStaysInBand) {
    BackoffConfig cfg{1000, 1000, 2.0, 0.2};
    Backoff b(cfg, 12345);
    for (int i = 0; i < 200; ++i) {
        auto d = b.next().count();
        EXPECT_GE(d, 800);
        EXPECT_LE(d, 1000);  // never above the cap
    }
}

TEST(BackoffTest, ResetRestartsSequence) {
    BackoffConfig cfg{50, 10000, 2.0, 0.0};
    Backoff b(cfg, 1);
    b.next();
    b.next();
    b.reset();
    EXPECT_EQ(b.attempts(), 0);
    EXPECT_EQ(b.next().count(), 50);
}

TEST(BackoffTest, InvalidConfigIsClamped) {
    BackoffConfig cfg{-5, -10, 0.5, 4.0};
    Backoff b(cfg, 1);
    EXPECT_EQ(b.config().base_ms, 0);
    EXPECT_EQ(b.config().max_ms, 0);
    EXPECT_DOUBLE_EQ(b.config().multiplier, 1.0);
    EXPECT_DOUBLE_EQ(b.config().jitter, 1.0);
    EXPECT_EQ(b.next().count(), 0);
}

TEST(CancellationTokenTest, WaitReturnsTrueWhenNotCancelled) {
    CancellationToken t;
    EXPECT_TRUE(t.wait_for(std::chrono::milliseconds(1)));
    EXPECT_FALSE(t.cancelled());
}

TEST(CancellationTokenTest, CopiesShareState) {
    CancellationToken t;
    CancellationToken copy = t;
    copy.cancel();
    EXPECT_TRUE(t.cancelled());
    EXPECT_FALSE(t.wait_for(std::chrono::seconds(10)));
}

TEST(CancellationTokenTest, CancelWakesWaiter) {
    CancellationToken t;
    std::thread canceller([t]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        t.cancel();
    });
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(t.wait_for(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(5));
    canceller.join();
}
