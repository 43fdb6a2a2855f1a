#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <stddef.h>
#include <stdint.h>

// --- パイプライン設定 ---
const size_t TELEMETRY_QUEUE_LENGTH = 5;              // テレメトリキューの容量 (未配信スナップショット数の上限)
const unsigned long CHANNEL_POLL_INTERVAL_MS = 50;    // put/get 待機中にキャンセルを確認する間隔
const unsigned long SUBSCRIBE_POLL_INTERVAL_MS = 20;  // subscribe タスクが受信箱/キャンセル/切断を確認する間隔
const size_t NOTIFY_INBOX_LENGTH = 16;                // BLE通知コールバック → subscribe タスクの受け渡し容量
const size_t COMMAND_QUEUE_LENGTH = 4;                // ボタン操作 → コマンドタスクの受け渡し容量

// --- 動作設定 ---
const unsigned long BLE_CONNECT_TIMEOUT_MS = 10000;   // BLE接続タイムアウト
const unsigned long CONTROL_RESPONSE_TIMEOUT_MS = 1500; // Control Point 応答(Indication)待ち
const unsigned long NOTICE_DISPLAY_MS = 2000;         // エラー通知の表示時間
const unsigned long DEBUG_PRINT_INTERVAL_MS = 2000;   // デバッグ出力間隔
const unsigned long BTN_START_HOLD_MS = 1000;         // BtnC 長押しでスタート
const unsigned long BTN_DISCONNECT_HOLD_MS = 2000;    // BtnA 長押しで切断

// --- 計算用定数 (デフォルト値, 設定ファイルで上書き可) ---
const unsigned int DEFAULT_USER_HEIGHT_CM = 170;
const double DEFAULT_STRIDE_FACTOR = 0.415;  // 歩幅 = 身長(m) x この係数
const int DEFAULT_SPEED_STEP_UP = 2;         // 「+」ボタン1回あたりの速度ステップ
const int DEFAULT_SPEED_STEP_DOWN = -1;      // 「-」ボタン1回あたりの速度ステップ
const unsigned int MIN_USER_HEIGHT_CM = 50;
const unsigned int MAX_USER_HEIGHT_CM = 250;

// --- 表示桁数 ---
const int DISTANCE_TEXT_WIDTH = 4;  // "0120"
const int CALORIES_TEXT_WIDTH = 4;  // "0045"

// --- FTMS 速度設定 (単位: 0.01 km/h) ---
const uint16_t SPEED_STEP_UNIT_X100 = 10;    // 速度ステップ1単位 = 0.1 km/h
const uint16_t MIN_TARGET_SPEED_X100 = 100;  // 1.0 km/h
const uint16_t MAX_TARGET_SPEED_X100 = 2000; // 20.0 km/h

// --- 設定ファイルパス (SDカード) ---
extern const char* CONFIG_JSON_PATH;

// --- NVS 設定 (SD設定のミラー) ---
extern const char* NVS_NAMESPACE;
extern const char* NVS_KEY_DEVICE_ADDR;
extern const char* NVS_KEY_HEIGHT_CM;
extern const char* NVS_KEY_STRIDE;
extern const char* NVS_KEY_STEP_UP;
extern const char* NVS_KEY_STEP_DOWN;

// --- BLE 設定 ---
extern const char* BLE_DEVICE_NAME;

// --- 状態定義 ---
enum class AppState {
    INITIALIZING,   // 初期化中
    CONNECTING,     // トレッドミルへ接続中
    IDLE,           // 接続済み・停止中
    RUNNING,        // 接続済み・走行中
    DISCONNECTED,   // 切断 (BtnBで再接続)
    CONFIG_ERROR,   // 設定エラー (終端状態)
    BLE_ERROR       // BLE初期化失敗 (終端状態)
};

const char* stateName(AppState state); // ログ/画面用の短い名前
bool isTerminalState(AppState state);  // 再起動するまで抜けない状態か

#endif // CONFIG_HPP
