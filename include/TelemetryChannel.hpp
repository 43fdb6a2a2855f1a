#ifndef TELEMETRY_CHANNEL_HPP
#define TELEMETRY_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include "config.hpp"
#include "CancelToken.hpp"
#include "TelemetrySnapshot.hpp"

// 1プロデューサ/1コンシューマ用の有界FIFO。
// 満杯時の put() は空きが出るまで待つ (破棄・上書きはしない)。
class TelemetryChannel {
public:
    explicit TelemetryChannel(size_t capacity = TELEMETRY_QUEUE_LENGTH,
                              unsigned long pollIntervalMs = CHANNEL_POLL_INTERVAL_MS);

    // プロデューサ専用。キャンセルされた場合のみ false (何も積まない)
    bool put(const TelemetrySnapshot& snapshot, const CancelToken& token);
    // コンシューマ専用。キャンセルされた場合のみ false
    bool get(TelemetrySnapshot& out, const CancelToken& token);

    // 待たない版 (ブロックできない呼び出し元用)。満杯/空なら即 false
    bool tryPut(const TelemetrySnapshot& snapshot);
    bool tryGet(TelemetrySnapshot& out);

    size_t size() const;
    size_t capacity() const { return maxItems; }
    void clear(); // セッション終了時 (両タスク停止後) に呼ぶ

private:
    const size_t maxItems;
    const std::chrono::milliseconds pollInterval;

    mutable std::mutex bufferMutex;
    std::condition_variable notEmpty;
    std::condition_variable notFull;
    std::deque<TelemetrySnapshot> buffer;
};

#endif // TELEMETRY_CHANNEL_HPP
