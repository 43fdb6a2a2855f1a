#include <M5Stack.h>
#include <esp_pthread.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/task.h>
#include <atomic>
#include "config.hpp"
#include "AppConfig.hpp"
#include "Storage.hpp"
#include "Display.hpp"
#include "TreadmillClient.hpp"
#include "TelemetryChannel.hpp"
#include "TelemetryConsumerLoop.hpp"
#include "CommandDispatcher.hpp"
#include "ExclusiveTask.hpp"


// --- Global Objects ---
AppConfig appConfig;   // setup() で一度だけ埋める (以降は読み取り専用)
Storage storage;
Display display;
TreadmillClient treadmill;
TelemetryChannel telemetryChannel(TELEMETRY_QUEUE_LENGTH);
TelemetryConsumerLoop consumerLoop(telemetryChannel, display, appConfig.display);
CommandDispatcher dispatcher(treadmill, display, appConfig.steps);
ExclusiveTask subscribeTask("subscribe");
ExclusiveTask consumerTask("consumer");

// --- Global State ---
AppState currentState = AppState::INITIALIZING;
unsigned long lastDebugPrintTime = 0;
QueueHandle_t commandQueue = NULL;          // loop() → commandTask (ControlIntent)
std::atomic<bool> treadmillRunning(false);  // 最後に成功した Start/Stop の結果

const size_t TASK_STACK_SIZE = 6144;
const uint32_t COMMAND_TASK_STACK_SIZE = 4096;


// ボタン操作を1件ずつ実行するタスク。
// 応答待ちで数百ms止まるので、loop() や描画とは別に動かす。
void commandTask(void* pvParameters) {
    ControlIntent intent;
    for (;;) {
        if (xQueueReceive(commandQueue, &intent, portMAX_DELAY) != pdTRUE) continue;
        bool ok = dispatcher.dispatch(intent);
        if (ok && intent == ControlIntent::Start) treadmillRunning.store(true);
        if (ok && intent == ControlIntent::Stop) treadmillRunning.store(false);
    }
}

// 待たずにキューへ積む (詰まっていれば通知だけ出す)
void queueIntent(ControlIntent intent) {
    if (xQueueSend(commandQueue, &intent, 0) != pdTRUE) {
        display.showNotice(std::string(intentName(intent)) + " busy");
    }
}


// std::thread (pthread) のスタックサイズを設定する
void configureTaskStack() {
    esp_pthread_cfg_t cfg = esp_pthread_get_default_config();
    cfg.stack_size = TASK_STACK_SIZE;
    esp_err_t err = esp_pthread_set_cfg(&cfg);
    if (err != ESP_OK) {
        Serial.printf("Warning: esp_pthread_set_cfg failed (%d). Using default stack.\n", err);
    }
}

// 接続済みになったらパイプラインを起動
void startSession() {
    display.resetTelemetry();
    // どちらも前のインスタンスがあれば止めてから起動する
    consumerTask.start([](const CancelToken& token) { consumerLoop.run(token); });
    subscribeTask.start([](const CancelToken& token) { treadmill.subscribe(telemetryChannel, token); });
    Serial.printf("Main: Session started (consumer #%lu, subscribe #%lu).\n",
                  consumerTask.getStartCount(), subscribeTask.getStartCount());
}

// プロデューサ → コンシューマの順に止めて、キューを空にする
void teardownSession() {
    subscribeTask.cancelAndJoin(); // 購読解除まで待つ
    consumerTask.cancelAndJoin();
    telemetryChannel.clear();
    xQueueReset(commandQueue); // 未実行の操作は次の接続に持ち越さない
    Serial.println("Main: Session torn down.");
}


// --- Arduino Setup ---
void setup() {
    M5.begin(true, true, true, false); // LCD, SD, Serial, I2C=false
    Serial.begin(115200);
    Serial.println("\n\n=== Treadmill Dashboard Booting ===");

    display.begin();
    display.showMessage("Initializing...", 2, true);

    // Storage初期化 (SDが無くてもNVSのミラーで起動できる)
    if (!storage.begin()) {
        Serial.println("WARNING: SD Card initialization failed. Falling back to NVS config.");
    }

    String configError;
    if (!storage.loadAppConfig(appConfig, configError)) {
        Serial.printf("FATAL: Configuration error: %s\n", configError.c_str());
        display.setErrorDetail(configError);
        currentState = AppState::CONFIG_ERROR;
        display.update(currentState);
        return; // パイプラインは起動しない
    }

    if (!treadmill.begin()) {
        Serial.println("FATAL: BLE initialization failed.");
        display.setErrorDetail("NimBLE init failed");
        currentState = AppState::BLE_ERROR;
        display.update(currentState);
        return;
    }

    commandQueue = xQueueCreate(COMMAND_QUEUE_LENGTH, sizeof(ControlIntent));
    if (commandQueue == NULL ||
        xTaskCreate(commandTask, "Command Task", COMMAND_TASK_STACK_SIZE, NULL, 1, NULL) != pdPASS) {
        Serial.println("FATAL: Command task creation failed.");
        display.setErrorDetail("Command task creation failed");
        currentState = AppState::BLE_ERROR;
        display.update(currentState);
        return;
    }

    configureTaskStack();
    M5.Lcd.setBrightness(100);

    currentState = AppState::CONNECTING;
    Serial.println("Setup Complete. Entering main loop...");
}


// --- 状態別ハンドラ関数プロトタイプ ---
void handleConnectingState();
void handleSessionState();
void handleDisconnectedState();


// --- Arduino Loop ---
void loop() {
    unsigned long currentMillis = millis();
    M5.update(); // ボタン状態更新は最初に

    switch (currentState) {
        case AppState::CONNECTING:    handleConnectingState();   break;
        case AppState::IDLE:
        case AppState::RUNNING:       handleSessionState();      break;
        case AppState::DISCONNECTED:  handleDisconnectedState(); break;
        case AppState::CONFIG_ERROR:
        case AppState::BLE_ERROR:     /* 再起動するまで何もしない */ break;
        case AppState::INITIALIZING:  /* 通常ここには来ない */   break;
    }

    // --- デバッグ用シリアル出力 ---
    if (currentMillis - lastDebugPrintTime > DEBUG_PRINT_INTERVAL_MS) {
        Serial.printf("[%lu] State:%s Queue:%u/%u Rendered:%lu Drawn:%lu Notif:%lu DecodeErr:%lu InboxDrop:%lu CmdFail:%lu\n",
                      currentMillis, stateName(currentState),
                      (unsigned)telemetryChannel.size(), (unsigned)telemetryChannel.capacity(),
                      consumerLoop.getRenderedCount(), display.getDrawnFrameCount(),
                      treadmill.getNotificationCount(), treadmill.getDecodeErrorCount(),
                      treadmill.getInboxOverflowCount(), dispatcher.getFailureCount());
        lastDebugPrintTime = currentMillis;
    }

    // --- 画面表示更新 ---
    display.update(currentState);

    delay(10); // Main loop delay
}

// --- 状態別ハンドラ関数の実装 ---

void handleConnectingState() {
    display.update(currentState); // 接続はブロックするので先に画面を出す
    if (treadmill.connect(appConfig.deviceAddress.c_str())) {
        Serial.println("Main: Connected. Entering IDLE.");
        treadmillRunning.store(false);
        startSession();
        currentState = AppState::IDLE;
    } else {
        display.showNotice("Connect failed");
        currentState = AppState::DISCONNECTED;
    }
}

void handleSessionState() {
    // リンクが落ちたら後片付けして DISCONNECTED へ
    if (!treadmill.isConnected()) {
        Serial.println("Main: Link lost. Entering DISCONNECTED.");
        teardownSession();
        display.showNotice("Link lost");
        currentState = AppState::DISCONNECTED;
        return;
    }

    // ボタン処理
    if (M5.BtnA.pressedFor(BTN_DISCONNECT_HOLD_MS)) { // A長押しで切断
        Serial.println("Main: Disconnect requested via BtnA.");
        teardownSession();
        treadmill.disconnect();
        currentState = AppState::DISCONNECTED;
        return;
    }
    // 実行は commandTask 側。ここでは積むだけ
    if (M5.BtnA.wasPressed()) { // A: 即停止
        queueIntent(ControlIntent::Stop);
    } else if (M5.BtnB.wasReleased()) { // B: 減速
        queueIntent(ControlIntent::DecreaseSpeed);
    } else if (M5.BtnC.wasReleasefor(BTN_START_HOLD_MS)) { // C長押し: スタート
        queueIntent(ControlIntent::Start);
    } else if (M5.BtnC.wasReleased()) { // C: 加速
        queueIntent(ControlIntent::IncreaseSpeed);
    }

    currentState = treadmillRunning.load() ? AppState::RUNNING : AppState::IDLE;
}

void handleDisconnectedState() {
    if (M5.BtnB.wasPressed()) {
        Serial.println("Main: Reconnect requested via BtnB.");
        currentState = AppState::CONNECTING;
    }
}
