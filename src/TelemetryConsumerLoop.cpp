#include "TelemetryConsumerLoop.hpp"

TelemetryConsumerLoop::TelemetryConsumerLoop(TelemetryChannel& channelRef, RenderSink& sinkRef,
                                             const DisplaySettings& settingsRef) :
    channel(channelRef), sink(sinkRef), settings(settingsRef), renderedCount(0)
{}

void TelemetryConsumerLoop::run(const CancelToken& token) {
    TelemetrySnapshot snapshot;
    while (channel.get(snapshot, token)) { // false = キャンセル
        sink.publish(DisplayFormatter::derive(snapshot, settings));
        renderedCount.fetch_add(1);
    }
}
