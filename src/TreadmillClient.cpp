#include "TreadmillClient.hpp"

// コンストラクタ
TreadmillClient::TreadmillClient() :
    client(nullptr), dataChar(nullptr), controlChar(nullptr),
    inbox(NOTIFY_INBOX_LENGTH), receiving(false),
    lastSpeedHundredths(0), decodeErrorCount(0), notificationCount(0), inboxOverflowCount(0),
    responseReceived(false), responseOp(0), responseResult(0)
{}

bool TreadmillClient::begin() {
    NimBLEDevice::init(BLE_DEVICE_NAME);
    client = NimBLEDevice::createClient();
    if (client == nullptr) {
        Serial.println("[BLE] createClient() failed.");
        return false;
    }
    client->setConnectTimeout(BLE_CONNECT_TIMEOUT_MS);
    Serial.println("[BLE] NimBLE initialized.");
    return true;
}

// 接続してFTMSのキャラクタリスティックを探す
bool TreadmillClient::connect(const String& address) {
    if (client == nullptr) {
        Serial.println("[BLE] connect() called before begin().");
        return false;
    }
    releaseCharacteristics();

    Serial.printf("[BLE] Connecting to %s ...\n", address.c_str());
    if (!client->connect(NimBLEAddress(std::string(address.c_str()), BLE_ADDR_PUBLIC))) {
        Serial.printf("[BLE] Connection to %s failed.\n", address.c_str());
        return false;
    }
    Serial.println("[BLE] Connected");

    NimBLERemoteService* service = client->getService(NimBLEUUID(Ftms::SERVICE_UUID));
    if (service == nullptr) {
        Serial.println("[BLE] FTMS service (0x1826) not found.");
        client->disconnect();
        return false;
    }
    dataChar = service->getCharacteristic(NimBLEUUID(Ftms::TREADMILL_DATA_UUID));
    controlChar = service->getCharacteristic(NimBLEUUID(Ftms::CONTROL_POINT_UUID));
    if (dataChar == nullptr || !dataChar->canNotify()) {
        Serial.println("[BLE] Treadmill Data (0x2ACD) not found or not notifiable.");
        releaseCharacteristics();
        client->disconnect();
        return false;
    }
    if (controlChar == nullptr || !controlChar->canIndicate()) {
        Serial.println("[BLE] Control Point (0x2AD9) not found or not indicatable.");
        releaseCharacteristics();
        client->disconnect();
        return false;
    }

    // Control Point の応答は Indication で返ってくる
    bool indicateOk = controlChar->subscribe(false,
        [this](NimBLERemoteCharacteristic*, uint8_t* data, size_t length, bool) {
            onControlIndication(data, length);
        });
    if (!indicateOk) {
        Serial.println("[BLE] Failed to subscribe to Control Point indications.");
        releaseCharacteristics();
        client->disconnect();
        return false;
    }

    // 操作の前に制御権を取る
    if (!writeControl(Ftms::encodeRequestControl(), "Request Control")) {
        releaseCharacteristics();
        client->disconnect();
        return false;
    }
    return true;
}

void TreadmillClient::disconnect() {
    if (client != nullptr && client->isConnected()) {
        Serial.println("[BLE] Disconnecting...");
        client->disconnect();
    }
    releaseCharacteristics();
}

bool TreadmillClient::isConnected() {
    return client != nullptr && client->isConnected();
}

void TreadmillClient::releaseCharacteristics() {
    dataChar = nullptr;      // 実体は NimBLEClient が所有
    controlChar = nullptr;
}

// --- DeviceController ---

bool TreadmillClient::start() {
    return writeControl(Ftms::encodeStart(), "Start");
}

bool TreadmillClient::stop() {
    return writeControl(Ftms::encodeStop(), "Stop");
}

bool TreadmillClient::setSpeed(int step) {
    uint16_t current = lastSpeedHundredths.load();
    uint16_t target = Ftms::computeTargetSpeed(current, step);
    Serial.printf("[BLE] Speed %u -> %u (x0.01 km/h, step %d)\n", current, target, step);
    return writeControl(Ftms::encodeSetTargetSpeed(target), "Set Target Speed");
}

// 接続中ずっと動く購読タスク本体 (唯一のプロデューサ)
void TreadmillClient::subscribe(TelemetryChannel& channel, const CancelToken& token) {
    if (!isConnected() || dataChar == nullptr) {
        Serial.println("[BLE] subscribe(): not connected.");
        return;
    }
    NimBLERemoteCharacteristic* chr = dataChar;

    decoder.reset();
    inbox.clear();
    receiving.store(true);

    bool ok = chr->subscribe(true,
        [this](NimBLERemoteCharacteristic*, uint8_t* data, size_t length, bool) {
            onTreadmillData(data, length);
        });
    if (!ok) {
        Serial.println("[BLE] Failed to subscribe to Treadmill Data.");
    } else {
        Serial.println("[BLE] Subscribed to Treadmill Data.");
        while (!token.isCancelled() && isConnected()) {
            TelemetrySnapshot snapshot;
            if (!inbox.tryGet(snapshot)) {
                delay(SUBSCRIBE_POLL_INTERVAL_MS);
                continue;
            }
            if (!channel.put(snapshot, token)) break; // 満杯なら空くまで待つ。false = キャンセル
        }
        if (isConnected()) {
            if (!chr->unsubscribe()) {
                Serial.println("[BLE] Warning: unsubscribe from Treadmill Data failed.");
            }
        }
    }

    receiving.store(false);
    inbox.clear();
    Serial.printf("[BLE] Subscription ended (%s).\n", token.isCancelled() ? "cancelled" : "disconnected");
}

// NimBLE ホストタスクから呼ばれる (ここでは待たない)
void TreadmillClient::onTreadmillData(uint8_t* data, size_t length) {
    if (!receiving.load()) return;
    notificationCount.fetch_add(1);

    TelemetrySnapshot snapshot;
    if (!decoder.decode(data, length, snapshot)) {
        // このフレームだけ捨てる (購読は継続)
        decodeErrorCount.fetch_add(1);
        Serial.printf("[BLE] Dropped malformed Treadmill Data frame (%u bytes).\n", (unsigned)length);
        return;
    }
    lastSpeedHundredths.store(snapshot.speedHundredths);

    if (!inbox.tryPut(snapshot)) {
        inboxOverflowCount.fetch_add(1);
        Serial.println("[BLE] Inbox full, Treadmill Data frame dropped.");
    }
}

void TreadmillClient::onControlIndication(uint8_t* data, size_t length) {
    uint8_t op = 0;
    uint8_t result = 0;
    if (!Ftms::parseControlResponse(data, length, op, result)) {
        Serial.printf("[BLE] Unexpected Control Point indication (%u bytes).\n", (unsigned)length);
        return;
    }
    responseOp.store(op);
    responseResult.store(result);
    responseReceived.store(true);
}

// Control Point に書き込み、Indication の結果を待つ
bool TreadmillClient::writeControl(const std::vector<uint8_t>& payload, const char* label) {
    if (!isConnected() || controlChar == nullptr) {
        Serial.printf("[BLE] %s: not connected.\n", label);
        return false;
    }

    responseReceived.store(false);
    if (!controlChar->writeValue(payload.data(), payload.size(), true)) {
        Serial.printf("[BLE] %s: write failed.\n", label);
        return false;
    }

    unsigned long startMs = millis();
    while (!responseReceived.load()) {
        if (millis() - startMs > CONTROL_RESPONSE_TIMEOUT_MS) {
            Serial.printf("[BLE] %s: no response from treadmill.\n", label);
            return false;
        }
        delay(10);
    }

    uint8_t op = responseOp.load();
    uint8_t result = responseResult.load();
    if (op != payload[0]) {
        Serial.printf("[BLE] %s: response for op 0x%02X, expected 0x%02X.\n", label, op, payload[0]);
        return false;
    }
    if (result != Ftms::RESULT_SUCCESS) {
        Serial.printf("[BLE] %s: %s (0x%02X).\n", label, Ftms::resultName(result), result);
        return false;
    }
    Serial.printf("[BLE] %s: OK\n", label);
    return true;
}
