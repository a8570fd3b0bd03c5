#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "probe/concurrency_limiter.hpp"

using q2browse::CancellationSource;
using q2browse::probe::ConcurrencyLimiter;
using namespace std::chrono_literals;

TEST(ConcurrencyLimiter, ZeroCapacityIsClampedToOne) {
    ConcurrencyLimiter limiter(0);
    EXPECT_EQ(limiter.capacity(), 1u);
}

TEST(ConcurrencyLimiter, PermitReleasesOnDestruction) {
    ConcurrencyLimiter limiter(2);
    CancellationSource source;
    {
        auto first = limiter.acquire(source.token());
        auto second = limiter.acquire(source.token());
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(second.has_value());
        EXPECT_EQ(limiter.inFlight(), 2u);
        second->release();
        EXPECT_EQ(limiter.inFlight(), 1u);
    }
    EXPECT_EQ(limiter.inFlight(), 0u);
}

TEST(ConcurrencyLimiter, MovedPermitReleasesOnce) {
    ConcurrencyLimiter limiter(1);
    CancellationSource source;
    auto permit = limiter.acquire(source.token());
    ASSERT_TRUE(permit.has_value());
    auto moved = std::move(*permit);
    permit.reset();
    EXPECT_EQ(limiter.inFlight(), 1u);
    moved.release();
    EXPECT_EQ(limiter.inFlight(), 0u);
}

TEST(ConcurrencyLimiter, NeverExceedsCapacity) {
    constexpr std::size_t kCapacity = 3;
    ConcurrencyLimiter limiter(kCapacity);
    CancellationSource source;
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&]() {
            auto permit = limiter.acquire(source.token());
            ASSERT_TRUE(permit.has_value());
            const int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(10ms);
            --active;
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_LE(peak.load(), static_cast<int>(kCapacity));
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(limiter.inFlight(), 0u);
}

TEST(ConcurrencyLimiter, CancellationWakesBlockedAcquire) {
    ConcurrencyLimiter limiter(1);
    CancellationSource source;
    auto held = limiter.acquire(source.token());
    ASSERT_TRUE(held.has_value());

    std::atomic<bool> gotPermit{true};
    std::thread waiter([&]() {
        gotPermit = limiter.acquire(source.token()).has_value();
    });
    std::this_thread::sleep_for(30ms);
    source.cancel();
    waiter.join();

    EXPECT_FALSE(gotPermit.load());
    EXPECT_FALSE(limiter.acquire(source.token()).has_value());
}
