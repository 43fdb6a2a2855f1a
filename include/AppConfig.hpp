#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include <string>
#include "CommandDispatcher.hpp"
#include "DisplayFormatter.hpp"

// JSONドキュメント容量
#define JSON_APP_CONFIG_CAPACITY 512

// 起動時に一度だけ読み込む設定 (以降は読み取り専用)
struct AppConfig {
    std::string deviceAddress;  // "AA:BB:CC:DD:EE:FF"
    DisplaySettings display;
    SpeedSteps steps;
};

// 採用した設定の出どころ
enum class ConfigSource {
    SdFile,     // SDカードの JSON
    NvsMirror   // 前回起動時にミラーした NVS の値
};

// JSON文字列を解析して検証まで行う。失敗時は error に理由を入れて false (ArduinoJson)
bool parseAppConfig(const char* json, AppConfig& out, std::string& error);

typedef bool (*AppConfigParser)(const char* json, AppConfig& out, std::string& error);

// 起動時の設定を決める。
// sdJson はSDのファイル内容 (SD無し/ファイル無し/空なら nullptr か "")。
// ファイルがあればその解析結果だけで決め、壊れていても NVS には戻らない。
// ファイルが無いときだけ nvsConfig (無ければ nullptr) を検証して使う。
bool resolveAppConfig(const char* sdJson, const AppConfig* nvsConfig, AppConfigParser parser,
                      AppConfig& out, ConfigSource& source, std::string& error);

// 値の範囲チェック (NVSから読んだ設定にも使う)
bool validateAppConfig(const AppConfig& config, std::string& error);

// "XX:XX:XX:XX:XX:XX" (16進) か
bool isValidDeviceAddress(const std::string& address);

#endif // APP_CONFIG_HPP
