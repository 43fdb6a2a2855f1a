#include <gtest/gtest.h>

#include <atomic>

#include "ExclusiveTask.hpp"
#include "TestDoubles.hpp"

TEST(ExclusiveTaskTest, CancelAndJoinOnIdleTaskIsHarmless) {
    ExclusiveTask task("idle");
    EXPECT_FALSE(task.isRunning());
    task.cancelAndJoin();
    task.cancelAndJoin();
    EXPECT_EQ(0u, task.getStartCount());
    EXPECT_STREQ("idle", task.getName());
}

TEST(ExclusiveTaskTest, BodySeesCancellation) {
    ExclusiveTask task("worker");
    std::atomic<bool> sawCancel(false);
    task.start([&](const CancelToken& token) {
        while (!token.isCancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        sawCancel.store(true);
    });
    EXPECT_TRUE(task.isRunning());
    task.cancelAndJoin();
    EXPECT_TRUE(sawCancel.load());
    EXPECT_FALSE(task.isRunning());
}

TEST(ExclusiveTaskTest, RestartNeverOverlapsInstances) {
    ExclusiveTask task("worker");
    std::atomic<int> active(0);
    std::atomic<int> maxActive(0);

    for (int i = 0; i < 10; ++i) {
        task.start([&](const CancelToken& token) {
            int now = ++active;
            if (now > maxActive.load()) maxActive.store(now);
            while (!token.isCancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            --active;
        });
    }
    task.cancelAndJoin();

    EXPECT_EQ(10u, task.getStartCount());
    EXPECT_EQ(1, maxActive.load());
    EXPECT_EQ(0, active.load());
}

TEST(ExclusiveTaskTest, BodyThatReturnsOnItsOwnIsNotRunning) {
    ExclusiveTask task("oneshot");
    task.start([](const CancelToken&) {});
    EXPECT_TRUE(waitUntil([&]() { return !task.isRunning(); }));
    task.cancelAndJoin();
}
