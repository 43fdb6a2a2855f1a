#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "TelemetryChannel.hpp"
#include "TestDoubles.hpp"

TEST(TelemetryChannelTest, CapacityIsFive) {
    TelemetryChannel channel;
    EXPECT_EQ(5u, channel.capacity());
    EXPECT_EQ(0u, channel.size());
}

TEST(TelemetryChannelTest, DeliversInProductionOrderOnce) {
    TelemetryChannel channel(5, 10);
    CancelToken token;
    const uint32_t count = 200;
    std::vector<uint32_t> received;

    std::thread producer([&]() {
        for (uint32_t i = 0; i < count; ++i) {
            ASSERT_TRUE(channel.put(makeSnapshot(0, i, 0, 0), token));
        }
    });

    TelemetrySnapshot s;
    for (uint32_t i = 0; i < count; ++i) {
        ASSERT_TRUE(channel.get(s, token));
        received.push_back(s.distanceMeters);
        EXPECT_LE(channel.size(), 5u);
    }
    producer.join();

    ASSERT_EQ(count, received.size());
    for (uint32_t i = 0; i < count; ++i) {
        EXPECT_EQ(i, received[i]);
    }
    EXPECT_EQ(0u, channel.size());
}

TEST(TelemetryChannelTest, EmptySequenceDeliversNothing) {
    TelemetryChannel channel(5, 10);
    CancelToken token;
    token.cancel();
    TelemetrySnapshot s;
    EXPECT_FALSE(channel.get(s, token));
}

TEST(TelemetryChannelTest, PutOnFullChannelWaitsForOneGet) {
    TelemetryChannel channel(5, 10);
    CancelToken token;
    for (uint32_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(channel.put(makeSnapshot(0, i, 0, 0), token));
    }

    std::atomic<bool> sixthDone(false);
    std::thread producer([&]() {
        EXPECT_TRUE(channel.put(makeSnapshot(0, 5, 0, 0), token));
        sixthDone.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(sixthDone.load());
    EXPECT_EQ(5u, channel.size());

    TelemetrySnapshot s;
    ASSERT_TRUE(channel.get(s, token));
    EXPECT_EQ(0u, s.distanceMeters);

    EXPECT_TRUE(waitUntil([&]() { return sixthDone.load(); }));
    producer.join();
    EXPECT_EQ(5u, channel.size());

    // 何も捨てられていない
    for (uint32_t i = 1; i <= 5; ++i) {
        ASSERT_TRUE(channel.get(s, token));
        EXPECT_EQ(i, s.distanceMeters);
    }
}

TEST(TelemetryChannelTest, CancelReleasesBlockedPut) {
    TelemetryChannel channel(5, 10);
    CancelToken fillToken;
    for (uint32_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(channel.put(makeSnapshot(0, i, 0, 0), fillToken));
    }

    CancelToken token;
    std::atomic<bool> returned(false);
    std::atomic<bool> result(true);
    std::thread producer([&]() {
        result.store(channel.put(makeSnapshot(0, 99, 0, 0), token));
        returned.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(returned.load());
    token.cancel();

    EXPECT_TRUE(waitUntil([&]() { return returned.load(); }, 1000));
    producer.join();
    EXPECT_FALSE(result.load());
    EXPECT_EQ(5u, channel.size()); // キャンセルされた put は何も積まない
}

TEST(TelemetryChannelTest, CancelReleasesBlockedGet) {
    TelemetryChannel channel(5, 10);
    CancelToken token;
    std::atomic<bool> returned(false);
    std::thread consumer([&]() {
        TelemetrySnapshot s;
        EXPECT_FALSE(channel.get(s, token));
        returned.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(returned.load());
    token.cancel();
    EXPECT_TRUE(waitUntil([&]() { return returned.load(); }, 1000));
    consumer.join();
}

TEST(TelemetryChannelTest, ClearDropsPendingSnapshots) {
    TelemetryChannel channel(5, 10);
    CancelToken token;
    ASSERT_TRUE(channel.put(makeSnapshot(1, 2, 3, 4), token));
    ASSERT_TRUE(channel.put(makeSnapshot(5, 6, 7, 8), token));
    channel.clear();
    EXPECT_EQ(0u, channel.size());
}

TEST(TelemetryChannelTest, TryPutReturnsImmediatelyWhenFull) {
    TelemetryChannel channel(3, 10);
    for (uint32_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(channel.tryPut(makeSnapshot(0, i, 0, 0)));
    }

    std::chrono::steady_clock::time_point before = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.tryPut(makeSnapshot(0, 99, 0, 0)));
    long elapsedMs = (long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - before).count();
    EXPECT_LT(elapsedMs, 50);
    EXPECT_EQ(3u, channel.size());

    // 溢れた分は積まれず、順序も崩れない
    TelemetrySnapshot s;
    for (uint32_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(channel.tryGet(s));
        EXPECT_EQ(i, s.distanceMeters);
    }
    EXPECT_FALSE(channel.tryGet(s));
}

TEST(TelemetryChannelTest, TryPutWakesBlockedGet) {
    TelemetryChannel channel(5, 1000); // 起床はポーリングではなく通知で
    CancelToken token;
    std::atomic<bool> received(false);
    std::thread consumer([&]() {
        TelemetrySnapshot s;
        EXPECT_TRUE(channel.get(s, token));
        EXPECT_EQ(7u, s.distanceMeters);
        received.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_TRUE(channel.tryPut(makeSnapshot(0, 7, 0, 0)));
    EXPECT_TRUE(waitUntil([&]() { return received.load(); }, 500));
    consumer.join();
}
