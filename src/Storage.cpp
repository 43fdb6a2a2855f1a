#include "Storage.hpp"
#include <M5Stack.h> // Serial用

Storage::Storage() : sdCardOk(false) {}

bool Storage::begin() {
    if (preferences.begin(NVS_NAMESPACE, true)) {
        preferences.end();
    } else {
        Serial.printf("[Storage] NVS namespace '%s' not created yet.\n", NVS_NAMESPACE);
    }
    sdCardOk = SD.begin(TFCARD_CS_PIN, SPI, 40000000);
    Serial.println(sdCardOk ? "[Storage] SD card mounted." : "[Storage] SD card not available.");
    return sdCardOk;
}

String Storage::readFileContent(const char* path) {
    if (!sdCardOk || !SD.exists(path)) return String();
    File file = SD.open(path, FILE_READ);
    if (!file) {
        Serial.printf("[Storage] Cannot open %s\n", path);
        return String();
    }
    if (file.isDirectory()) {
        file.close();
        Serial.printf("[Storage] %s is a directory\n", path);
        return String();
    }
    String content = file.readString();
    file.close();
    return content;
}

bool Storage::loadAppConfig(AppConfig& config, String& error) {
    String jsonContent = readFileContent(CONFIG_JSON_PATH);
    if (jsonContent.length() == 0) {
        Serial.printf("[Storage] %s not found. Looking for NVS mirror...\n", CONFIG_JSON_PATH);
    }

    AppConfig mirrored;
    bool hasMirror = loadConfigFromNVS(mirrored);

    ConfigSource source = ConfigSource::SdFile;
    std::string resolveError;
    if (!resolveAppConfig(jsonContent.c_str(), hasMirror ? &mirrored : nullptr, parseAppConfig,
                          config, source, resolveError)) {
        error = resolveError.c_str();
        return false;
    }

    if (source == ConfigSource::SdFile) {
        // 次回SDが無くても起動できるようにミラーしておく
        if (!saveConfigToNVS(config)) {
            Serial.println("[Storage] Warning: failed to mirror config to NVS.");
        }
    }
    Serial.printf("[Storage] Config (%s): device=%s height=%ucm stride=%.3f steps=+%d/%d\n",
                  source == ConfigSource::SdFile ? "SD" : "NVS",
                  config.deviceAddress.c_str(), config.display.userHeightCm,
                  config.display.strideFactor, config.steps.increase, config.steps.decrease);
    return true;
}


// --- NVS 関連 ---

bool Storage::loadConfigFromNVS(AppConfig& config) {
    if (!preferences.begin(NVS_NAMESPACE, true)) {
        Serial.println("[loadConfigNVS] NVS begin (readOnly) failed.");
        return false;
    }
    String address = preferences.getString(NVS_KEY_DEVICE_ADDR, "");
    uint32_t heightCm = preferences.getUInt(NVS_KEY_HEIGHT_CM, 0);
    double stride = preferences.getDouble(NVS_KEY_STRIDE, DEFAULT_STRIDE_FACTOR);
    int32_t stepUp = preferences.getInt(NVS_KEY_STEP_UP, DEFAULT_SPEED_STEP_UP);
    int32_t stepDown = preferences.getInt(NVS_KEY_STEP_DOWN, DEFAULT_SPEED_STEP_DOWN);
    preferences.end();

    if (address.length() == 0 || heightCm == 0) {
        Serial.println("[loadConfigNVS] No config stored in NVS.");
        return false;
    }
    config.deviceAddress = address.c_str();
    config.display.userHeightCm = heightCm;
    config.display.strideFactor = stride;
    config.steps.increase = stepUp;
    config.steps.decrease = stepDown;
    Serial.println("Config loaded from NVS.");
    return true;
}

bool Storage::saveConfigToNVS(const AppConfig& config) {
     if (!preferences.begin(NVS_NAMESPACE, false)) {
         Serial.println("[saveConfigNVS] NVS begin (readWrite) failed.");
         return false;
     }
     bool s1 = preferences.putString(NVS_KEY_DEVICE_ADDR, config.deviceAddress.c_str()) > 0;
     bool s2 = preferences.putUInt(NVS_KEY_HEIGHT_CM, config.display.userHeightCm) > 0;
     bool s3 = preferences.putDouble(NVS_KEY_STRIDE, config.display.strideFactor) > 0;
     bool s4 = preferences.putInt(NVS_KEY_STEP_UP, config.steps.increase) > 0;
     bool s5 = preferences.putInt(NVS_KEY_STEP_DOWN, config.steps.decrease) > 0;
     preferences.end();
     if (s1 && s2 && s3 && s4 && s5) { Serial.println("Config mirrored to NVS."); return true; }
     else { Serial.println("Failed to save config to NVS."); return false; }
}
