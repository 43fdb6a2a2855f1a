#include "config.hpp"

// --- 設定ファイルパス (SDカード) ---
const char* CONFIG_JSON_PATH = "/treaddash.json";

// --- NVS 設定 (不揮発メモリ) ---
const char* NVS_NAMESPACE = "treaddash";
const char* NVS_KEY_DEVICE_ADDR = "devAddr";
const char* NVS_KEY_HEIGHT_CM = "heightCm";
const char* NVS_KEY_STRIDE = "stride";
const char* NVS_KEY_STEP_UP = "stepUp";
const char* NVS_KEY_STEP_DOWN = "stepDown";

// --- BLE 設定 ---
const char* BLE_DEVICE_NAME = "treaddash";

const char* stateName(AppState state) {
    switch (state) {
        case AppState::INITIALIZING: return "INIT";
        case AppState::CONNECTING:   return "CONNECTING";
        case AppState::IDLE:         return "IDLE";
        case AppState::RUNNING:      return "RUNNING";
        case AppState::DISCONNECTED: return "DISCONNECTED";
        case AppState::CONFIG_ERROR: return "CONFIG_ERROR";
        case AppState::BLE_ERROR:    return "BLE_ERROR";
    }
    return "?";
}

bool isTerminalState(AppState state) {
    return state == AppState::CONFIG_ERROR || state == AppState::BLE_ERROR;
}

// 他の const 変数は config.hpp 内で定義済み
