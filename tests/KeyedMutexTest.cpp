#include "core/transfer/KeyedMutex.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using courier::core::transfer::KeyedMutex;
using courier::test::waitUntil;

TEST(KeyedMutexTest, GuardReleasesOnDestruction) {
    KeyedMutex mutex;
    {
        auto guard = mutex.lock("a");
        EXPECT_TRUE(guard.ownsLock());
        EXPECT_EQ(guard.key(), "a");
        EXPECT_TRUE(mutex.isLocked("a"));
        EXPECT_EQ(mutex.size(), 1u);
    }
    EXPECT_FALSE(mutex.isLocked("a"));
    EXPECT_EQ(mutex.size(), 0u);
}

TEST(KeyedMutexTest, DistinctKeysDoNotContend) {
    KeyedMutex mutex;
    auto a = mutex.lock("a");
    auto b = mutex.tryLock("b");

    EXPECT_TRUE(b.ownsLock());
    EXPECT_EQ(mutex.size(), 2u);
}

TEST(KeyedMutexTest, TryLockFailsOnBusyKey) {
    KeyedMutex mutex;
    auto held = mutex.lock("k");

    auto attempt = mutex.tryLock("k");
    EXPECT_FALSE(attempt.ownsLock());

    held.unlock();
    EXPECT_FALSE(held.ownsLock());
    EXPECT_TRUE(mutex.tryLock("k").ownsLock());
}

TEST(KeyedMutexTest, MovedGuardKeepsOwnership) {
    KeyedMutex mutex;
    auto first = mutex.lock("k");
    KeyedMutex::Guard second(std::move(first));

    EXPECT_FALSE(first.ownsLock());
    EXPECT_TRUE(second.ownsLock());
    EXPECT_TRUE(mutex.isLocked("k"));

    second = KeyedMutex::Guard();
    EXPECT_FALSE(mutex.isLocked("k"));
}

TEST(KeyedMutexTest, WaiterProceedsAfterRelease) {
    KeyedMutex mutex;
    auto held = mutex.lock("k");
    std::atomic<bool> acquired{false};

    std::thread waiter([&] {
        auto guard = mutex.lock("k");
        acquired = true;
    });

    ASSERT_TRUE(waitUntil([&] { return mutex.waiterCount("k") == 1; }));
    EXPECT_FALSE(acquired);

    held.unlock();
    waiter.join();
    EXPECT_TRUE(acquired);
    EXPECT_EQ(mutex.size(), 0u);
}

TEST(KeyedMutexTest, SerializesCriticalSections) {
    KeyedMutex mutex;
    std::atomic<int> inside{0};
    std::atomic<bool> overlap{false};
    int counter = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                auto guard = mutex.lock("shared");
                if (++inside > 1) overlap = true;
                ++counter;
                --inside;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_FALSE(overlap);
    EXPECT_EQ(counter, 1600);
    EXPECT_EQ(mutex.size(), 0u);
}
