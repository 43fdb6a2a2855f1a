#ifndef TREADMILL_CLIENT_HPP
#define TREADMILL_CLIENT_HPP

#include <Arduino.h>
#include <NimBLEDevice.h>
#include <atomic>
#include <vector>
#include "config.hpp"
#include "DeviceController.hpp"
#include "FtmsCodec.hpp"

// FTMS トレッドミルへの BLE セントラル接続 (NimBLE)。
// 接続管理と Control Point の読み書きを担当する。
// 通知/Indication は NimBLE ホストタスクで届くので、コールバックでは待たない:
// Treadmill Data はデコードして inbox に積むだけで、テレメトリキューへの
// put() (満杯なら待つ) は subscribe タスク側で行う。
class TreadmillClient : public DeviceController {
public:
    TreadmillClient();
    bool begin();                           // NimBLE 初期化
    bool connect(const String& address);    // 接続 + サービス探索 + 制御権要求
    void disconnect();
    bool isConnected();

    // DeviceController
    bool start() override;
    bool stop() override;
    bool setSpeed(int step) override;
    void subscribe(TelemetryChannel& channel, const CancelToken& token) override;

    unsigned long getDecodeErrorCount() const { return decodeErrorCount.load(); }
    unsigned long getNotificationCount() const { return notificationCount.load(); }
    unsigned long getInboxOverflowCount() const { return inboxOverflowCount.load(); }

private:
    NimBLEClient* client;
    NimBLERemoteCharacteristic* dataChar;     // Treadmill Data (0x2ACD)
    NimBLERemoteCharacteristic* controlChar;  // Control Point (0x2AD9)
    FtmsDecoder decoder;                      // 通知コールバック内でのみ使う

    TelemetryChannel inbox;                   // コールバック → subscribe タスク (tryPut/tryGet のみ)
    std::atomic<bool> receiving;              // subscribe 中だけ true

    std::atomic<uint16_t> lastSpeedHundredths; // 最後に通知された速度 (setSpeed の基準)
    std::atomic<unsigned long> decodeErrorCount;
    std::atomic<unsigned long> notificationCount;
    std::atomic<unsigned long> inboxOverflowCount;

    // Control Point 応答 (Indication) の受け渡し
    std::atomic<bool> responseReceived;
    std::atomic<uint8_t> responseOp;
    std::atomic<uint8_t> responseResult;

    bool writeControl(const std::vector<uint8_t>& payload, const char* label);
    void onTreadmillData(uint8_t* data, size_t length);
    void onControlIndication(uint8_t* data, size_t length);
    void releaseCharacteristics();
};

#endif // TREADMILL_CLIENT_HPP
