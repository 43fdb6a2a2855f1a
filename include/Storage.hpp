#ifndef STORAGE_HPP
#define STORAGE_HPP

#include <Preferences.h>
#include <SD.h>
#include <FS.h>
#include "config.hpp"
#include "AppConfig.hpp"

// 設定の永続化: SDカードのJSON (正) と NVS のミラー (SD無しで起動するため)
class Storage {
public:
    Storage();
    bool begin(); // NVS確認 + SDマウント。SDが無ければ false

    // SDのファイルがあればそれを、無ければNVSのミラーを使う。
    // どちらも使えない/ファイルが壊れている場合は false と理由
    bool loadAppConfig(AppConfig& config, String& error);

    bool loadConfigFromNVS(AppConfig& config);
    bool saveConfigToNVS(const AppConfig& config);

    // SD上のファイルを丸ごと読む (無い/読めないときは空文字)
    String readFileContent(const char* path);

private:
    Preferences preferences;
    bool sdCardOk;
};

#endif // STORAGE_HPP
