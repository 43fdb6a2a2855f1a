#include "AppConfig.hpp"
#include <ctype.h>
#include <stdio.h>

bool isValidDeviceAddress(const std::string& address) {
    if (address.size() != 17) return false;
    for (size_t i = 0; i < address.size(); ++i) {
        if (i % 3 == 2) {
            if (address[i] != ':') return false;
        } else if (!isxdigit((unsigned char)address[i])) {
            return false;
        }
    }
    return true;
}

bool validateAppConfig(const AppConfig& config, std::string& error) {
    if (!isValidDeviceAddress(config.deviceAddress)) {
        error = "device_address must look like AA:BB:CC:DD:EE:FF";
        return false;
    }
    if (config.display.userHeightCm < MIN_USER_HEIGHT_CM || config.display.userHeightCm > MAX_USER_HEIGHT_CM) {
        char buf[64];
        snprintf(buf, sizeof(buf), "user_height_cm must be %u..%u", MIN_USER_HEIGHT_CM, MAX_USER_HEIGHT_CM);
        error = buf;
        return false;
    }
    if (!(config.display.strideFactor > 0.0)) {
        error = "stride_factor must be positive";
        return false;
    }
    if (config.steps.increase <= 0) {
        error = "speed_step_up must be positive";
        return false;
    }
    if (config.steps.decrease >= 0) {
        error = "speed_step_down must be negative";
        return false;
    }
    return true;
}

bool resolveAppConfig(const char* sdJson, const AppConfig* nvsConfig, AppConfigParser parser,
                      AppConfig& out, ConfigSource& source, std::string& error) {
    bool sdFilePresent = sdJson != nullptr && sdJson[0] != '\0';

    if (sdFilePresent) {
        // ファイルがある以上、壊れていれば設定エラー
        AppConfig parsed;
        std::string parseError;
        if (parser == nullptr || !parser(sdJson, parsed, parseError)) {
            error = std::string("SD config invalid: ") + parseError;
            return false;
        }
        out = parsed;
        source = ConfigSource::SdFile;
        return true;
    }

    if (nvsConfig == nullptr) {
        error = "no config on SD card or in NVS";
        return false;
    }
    std::string validationError;
    if (!validateAppConfig(*nvsConfig, validationError)) {
        error = std::string("NVS config invalid: ") + validationError;
        return false;
    }
    out = *nvsConfig;
    source = ConfigSource::NvsMirror;
    return true;
}
