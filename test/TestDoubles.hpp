#ifndef TEST_DOUBLES_HPP
#define TEST_DOUBLES_HPP

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "DeviceController.hpp"
#include "RenderSink.hpp"
#include "TelemetrySnapshot.hpp"

inline TelemetrySnapshot makeSnapshot(uint16_t speed, uint32_t distance, uint16_t calories, uint32_t seconds) {
    TelemetrySnapshot s;
    s.speedHundredths = speed;
    s.distanceMeters = distance;
    s.caloriesKcal = calories;
    s.elapsedSeconds = seconds;
    return s;
}

// 受け取った表示と通知を記録するだけのシンク
class RecordingRenderSink : public RenderSink {
public:
    void publish(const DerivedDisplay& display) override {
        std::lock_guard<std::mutex> lock(mutex);
        displays.push_back(display);
    }
    void showNotice(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        notices.push_back(message);
    }
    size_t displayCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return displays.size();
    }
    std::vector<DerivedDisplay> copyDisplays() {
        std::lock_guard<std::mutex> lock(mutex);
        return displays;
    }
    std::vector<std::string> copyNotices() {
        std::lock_guard<std::mutex> lock(mutex);
        return notices;
    }

private:
    std::mutex mutex;
    std::vector<DerivedDisplay> displays;
    std::vector<std::string> notices;
};

// 呼び出しを記録し、subscribe では用意したスナップショットを流し続ける
class FakeDeviceController : public DeviceController {
public:
    FakeDeviceController() :
        failCommands(false), commandDelayMs(0), startCalls(0), stopCalls(0),
        subscribeReturned(false), produced(0) {}

    // 実機の応答待ちの代わりに commandDelayMs だけ止まる
    bool start() override { waitForResponse(); ++startCalls; return !failCommands; }
    bool stop() override { waitForResponse(); ++stopCalls; return !failCommands; }
    bool setSpeed(int step) override { waitForResponse(); speedSteps.push_back(step); return !failCommands; }

    // 無限に番号付きスナップショットを生成 (キャンセルされるまで)
    void subscribe(TelemetryChannel& channel, const CancelToken& token) override {
        uint32_t n = 0;
        while (channel.put(makeSnapshot(100, n, 0, n), token)) {
            ++n;
            produced.store(n);
        }
        subscribeReturned.store(true);
    }

    bool failCommands;
    int commandDelayMs;
    int startCalls;
    int stopCalls;
    std::vector<int> speedSteps;
    std::atomic<bool> subscribeReturned;
    std::atomic<uint32_t> produced;

private:
    void waitForResponse() {
        if (commandDelayMs > 0) std::this_thread::sleep_for(std::chrono::milliseconds(commandDelayMs));
    }
};

// 条件が満たされるまで最大 timeoutMs 待つ
template <typename Pred>
bool waitUntil(Pred pred, int timeoutMs = 2000) {
    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

#endif // TEST_DOUBLES_HPP
