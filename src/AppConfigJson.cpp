#include "AppConfig.hpp"
#include <ArduinoJson.h>

bool parseAppConfig(const char* json, AppConfig& out, std::string& error) {
    if (json == nullptr || json[0] == '\0') {
        error = "config is empty";
        return false;
    }

    StaticJsonDocument<JSON_APP_CONFIG_CAPACITY> doc;
    DeserializationError jsonError = deserializeJson(doc, json);
    if (jsonError) {
        error = std::string("deserializeJson() failed: ") + jsonError.c_str();
        return false;
    }

    AppConfig parsed;

    // 必須: デバイスアドレス
    if (!doc["device_address"].is<const char*>()) {
        error = "'device_address' not found or not a string";
        return false;
    }
    parsed.deviceAddress = doc["device_address"].as<const char*>();

    // 必須: 身長 (cm)
    if (!doc["user_height_cm"].is<int>()) {
        error = "'user_height_cm' not found or not an integer";
        return false;
    }
    int heightCm = doc["user_height_cm"].as<int>();
    if (heightCm <= 0) {
        error = "user_height_cm must be positive";
        return false;
    }
    parsed.display.userHeightCm = (unsigned int)heightCm;

    // 任意: キーがなければデフォルト値
    parsed.display.strideFactor = doc["stride_factor"] | DEFAULT_STRIDE_FACTOR;
    parsed.steps.increase = doc["speed_step_up"] | DEFAULT_SPEED_STEP_UP;
    parsed.steps.decrease = doc["speed_step_down"] | DEFAULT_SPEED_STEP_DOWN;

    if (!validateAppConfig(parsed, error)) {
        return false;
    }
    out = parsed;
    return true;
}
