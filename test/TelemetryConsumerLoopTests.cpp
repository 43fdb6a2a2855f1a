#include <gtest/gtest.h>

#include <stdio.h>
#include <string>

#include "ExclusiveTask.hpp"
#include "TelemetryChannel.hpp"
#include "TelemetryConsumerLoop.hpp"
#include "TestDoubles.hpp"

TEST(TelemetryConsumerLoopTest, RendersEverySnapshotInOrder) {
    TelemetryChannel channel(5, 10);
    RecordingRenderSink sink;
    DisplaySettings settings;
    settings.userHeightCm = 175;
    TelemetryConsumerLoop loop(channel, sink, settings);
    ExclusiveTask consumer("consumer");
    consumer.start([&](const CancelToken& token) { loop.run(token); });

    CancelToken producerToken;
    for (uint32_t i = 0; i < 20; ++i) {
        ASSERT_TRUE(channel.put(makeSnapshot(0, i, 0, 0), producerToken));
    }
    ASSERT_TRUE(waitUntil([&]() { return sink.displayCount() == 20; }));
    consumer.cancelAndJoin();
    EXPECT_FALSE(consumer.isRunning());

    std::vector<DerivedDisplay> displays = sink.copyDisplays();
    ASSERT_EQ(20u, displays.size());
    char expected[8];
    for (uint32_t i = 0; i < 20; ++i) {
        snprintf(expected, sizeof(expected), "%04u", i);
        EXPECT_EQ(std::string(expected), displays[i].distanceText);
    }
    EXPECT_EQ(20u, loop.getRenderedCount());
}

TEST(TelemetryConsumerLoopTest, CancelWhileWaitingIsSilent) {
    TelemetryChannel channel(5, 10);
    RecordingRenderSink sink;
    DisplaySettings settings;
    TelemetryConsumerLoop loop(channel, sink, settings);
    ExclusiveTask consumer("consumer");
    consumer.start([&](const CancelToken& token) { loop.run(token); });

    EXPECT_TRUE(consumer.isRunning());
    consumer.cancelAndJoin();
    EXPECT_FALSE(consumer.isRunning());
    EXPECT_EQ(0u, sink.displayCount());
}

TEST(TelemetryConsumerLoopTest, CancellingStalledProducerDoesNotBlockConsumer) {
    TelemetryChannel channel(5, 10);
    RecordingRenderSink sink;
    DisplaySettings settings;
    TelemetryConsumerLoop loop(channel, sink, settings);
    FakeDeviceController device;

    ExclusiveTask producer("subscribe");
    producer.start([&](const CancelToken& token) { device.subscribe(channel, token); });

    // コンシューマ未起動なのでプロデューサは満杯で止まる
    ASSERT_TRUE(waitUntil([&]() { return channel.size() == 5; }));
    EXPECT_FALSE(device.subscribeReturned.load());

    std::chrono::steady_clock::time_point before = std::chrono::steady_clock::now();
    producer.cancelAndJoin();
    long elapsedMs = (long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - before).count();
    EXPECT_TRUE(device.subscribeReturned.load());
    EXPECT_LT(elapsedMs, 1000);

    // 残っている分はコンシューマが普通に処理できる
    ExclusiveTask consumer("consumer");
    consumer.start([&](const CancelToken& token) { loop.run(token); });
    EXPECT_TRUE(waitUntil([&]() { return sink.displayCount() == 5; }));
    consumer.cancelAndJoin();
    EXPECT_EQ(5u, sink.displayCount());
}

TEST(TelemetryConsumerLoopTest, ProducerAndConsumerEndToEnd) {
    TelemetryChannel channel(5, 10);
    RecordingRenderSink sink;
    DisplaySettings settings;
    TelemetryConsumerLoop loop(channel, sink, settings);
    FakeDeviceController device;

    ExclusiveTask consumer("consumer");
    ExclusiveTask producer("subscribe");
    consumer.start([&](const CancelToken& token) { loop.run(token); });
    producer.start([&](const CancelToken& token) { device.subscribe(channel, token); });

    ASSERT_TRUE(waitUntil([&]() { return sink.displayCount() >= 50; }));
    producer.cancelAndJoin();
    consumer.cancelAndJoin();

    // 生成順に1回ずつ (途中で止めたので末尾は未配信でもよい)
    std::vector<DerivedDisplay> displays = sink.copyDisplays();
    char expected[16];
    for (size_t i = 0; i < displays.size(); ++i) {
        snprintf(expected, sizeof(expected), "%04u", (unsigned)i);
        ASSERT_EQ(std::string(expected), displays[i].distanceText);
    }
    EXPECT_LE(displays.size(), (size_t)device.produced.load());
}

TEST(TelemetryConsumerLoopTest, SecondStartReplacesFirstConsumer) {
    TelemetryChannel channel(5, 10);
    RecordingRenderSink sinkA;
    RecordingRenderSink sinkB;
    DisplaySettings settings;
    TelemetryConsumerLoop loopA(channel, sinkA, settings);
    TelemetryConsumerLoop loopB(channel, sinkB, settings);
    ExclusiveTask consumer("consumer");

    consumer.start([&](const CancelToken& token) { loopA.run(token); });
    consumer.start([&](const CancelToken& token) { loopB.run(token); }); // 前のインスタンスは停止済み
    EXPECT_EQ(2u, consumer.getStartCount());

    CancelToken producerToken;
    for (uint32_t i = 0; i < 10; ++i) {
        ASSERT_TRUE(channel.put(makeSnapshot(0, i, 0, 0), producerToken));
    }
    ASSERT_TRUE(waitUntil([&]() { return sinkB.displayCount() == 10; }));
    consumer.cancelAndJoin();

    // 各スナップショットにつき表示は1系列だけ
    EXPECT_EQ(0u, sinkA.displayCount());
    EXPECT_EQ(10u, sinkB.displayCount());
}
