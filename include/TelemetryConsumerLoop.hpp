#ifndef TELEMETRY_CONSUMER_LOOP_HPP
#define TELEMETRY_CONSUMER_LOOP_HPP

#include <atomic>
#include "CancelToken.hpp"
#include "DisplayFormatter.hpp"
#include "RenderSink.hpp"
#include "TelemetryChannel.hpp"

// キューから取り出したスナップショットを表示用に変換して RenderSink に流す。
// 唯一のコンシューマ。ExclusiveTask 上で動かすこと。
class TelemetryConsumerLoop {
public:
    TelemetryConsumerLoop(TelemetryChannel& channel, RenderSink& sink, const DisplaySettings& settings);

    // キャンセルされるまで戻らない
    void run(const CancelToken& token);

    unsigned long getRenderedCount() const { return renderedCount.load(); }

private:
    TelemetryChannel& channel;
    RenderSink& sink;
    const DisplaySettings& settings;
    std::atomic<unsigned long> renderedCount; // 表示に流した累計 (デバッグ用)
};

#endif // TELEMETRY_CONSUMER_LOOP_HPP
