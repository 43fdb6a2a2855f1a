#include "TelemetryChannel.hpp"

// コンストラクタ
TelemetryChannel::TelemetryChannel(size_t capacity, unsigned long pollIntervalMs) :
    maxItems(capacity > 0 ? capacity : 1),
    pollInterval(pollIntervalMs)
{}

// 満杯なら空きが出るかキャンセルされるまで待つ
bool TelemetryChannel::put(const TelemetrySnapshot& snapshot, const CancelToken& token) {
    std::unique_lock<std::mutex> lock(bufferMutex);
    while (buffer.size() >= maxItems) {
        if (token.isCancelled()) return false;
        notFull.wait_for(lock, pollInterval); // 定期的に起きてキャンセルを確認
    }
    if (token.isCancelled()) return false;
    buffer.push_back(snapshot);
    lock.unlock();
    notEmpty.notify_one();
    return true;
}

// 空なら届くかキャンセルされるまで待つ
bool TelemetryChannel::get(TelemetrySnapshot& out, const CancelToken& token) {
    std::unique_lock<std::mutex> lock(bufferMutex);
    while (buffer.empty()) {
        if (token.isCancelled()) return false;
        notEmpty.wait_for(lock, pollInterval);
    }
    if (token.isCancelled()) return false;
    out = buffer.front();
    buffer.pop_front();
    lock.unlock();
    notFull.notify_one();
    return true;
}

bool TelemetryChannel::tryPut(const TelemetrySnapshot& snapshot) {
    {
        std::lock_guard<std::mutex> lock(bufferMutex);
        if (buffer.size() >= maxItems) return false;
        buffer.push_back(snapshot);
    }
    notEmpty.notify_one();
    return true;
}

bool TelemetryChannel::tryGet(TelemetrySnapshot& out) {
    {
        std::lock_guard<std::mutex> lock(bufferMutex);
        if (buffer.empty()) return false;
        out = buffer.front();
        buffer.pop_front();
    }
    notFull.notify_one();
    return true;
}

size_t TelemetryChannel::size() const {
    std::lock_guard<std::mutex> lock(bufferMutex);
    return buffer.size();
}

void TelemetryChannel::clear() {
    {
        std::lock_guard<std::mutex> lock(bufferMutex);
        buffer.clear();
    }
    notFull.notify_all();
}
