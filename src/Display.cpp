#include "Display.hpp"
#include <stdio.h>

// コンストラクタ
Display::Display() :
    sprite(&M5.Lcd), drawMutex(NULL), shownState(AppState::INITIALIZING),
    noticeUntilMs(0), drawnFrames(0)
{}

// 初期化
void Display::begin() {
    drawMutex = xSemaphoreCreateMutex();
    if (drawMutex == NULL) {
        Serial.println("Display mutex creation failed!");
    }
    currentDisplay = DisplayFormatter::derive(TelemetrySnapshot(), DisplaySettings());

    sprite.setColorDepth(8); // 色深度(8bit=256色)
    if (sprite.createSprite(M5.Lcd.width(), M5.Lcd.height()) == nullptr) {
        Serial.println("Sprite creation failed! Check memory?");
    } else {
        Serial.println("Sprite created successfully.");
    }
    sprite.setTextFont(2);
    sprite.setTextColor(TFT_WHITE, TFT_BLACK);
    sprite.setTextSize(1);
    sprite.setTextDatum(TL_DATUM);
}

bool Display::lock() {
    return drawMutex != NULL && xSemaphoreTake(drawMutex, portMAX_DELAY) == pdTRUE;
}

void Display::unlock() {
    xSemaphoreGive(drawMutex);
}

// メッセージを画面中央に表示 (setup中などタスク起動前に使う)
void Display::showMessage(const String& msg, int size, bool clearScreen) {
    if (!lock()) return;
    if (clearScreen) sprite.fillSprite(BLACK);
    sprite.setTextSize(size);
    sprite.setTextDatum(MC_DATUM);
    sprite.drawString(msg, sprite.width() / 2, sprite.height() / 2);
    sprite.pushSprite(0, 0);
    sprite.setTextSize(1);
    sprite.setTextDatum(TL_DATUM);
    unlock();
}

void Display::setErrorDetail(const String& detail) {
    if (!lock()) return;
    errorDetail = detail;
    unlock();
}

// --- RenderSink ---

// フレームは受け取った順に1枚ずつ描く (間引かない)
void Display::publish(const DerivedDisplay& display) {
    if (!lock()) return;
    currentDisplay = display;
    if (shownState == AppState::IDLE || shownState == AppState::RUNNING) {
        renderLocked();
        drawnFrames.fetch_add(1);
    }
    unlock();
}

void Display::showNotice(const std::string& message) {
    Serial.printf("Notice: %s\n", message.c_str());
    if (!lock()) return;
    notice = message.c_str();
    noticeUntilMs = millis() + NOTICE_DISPLAY_MS;
    renderLocked();
    unlock();
}

void Display::resetTelemetry() {
    publish(DisplayFormatter::derive(TelemetrySnapshot(), DisplaySettings()));
}

void Display::update(AppState state) {
    if (!lock()) return;
    bool noticeExpired = notice.length() > 0 && (long)(millis() - noticeUntilMs) >= 0;
    if (noticeExpired) notice = "";
    if (state != shownState || noticeExpired) {
        shownState = state;
        renderLocked();
    }
    unlock();
}

// shownState に応じた画面を描いてLCDへ送る (drawMutex 取得済みで呼ぶ)
void Display::renderLocked() {
    switch (shownState) {
        case AppState::IDLE:
        case AppState::RUNNING:       displayDashboardScreen(); break;
        case AppState::CONNECTING:    displayConnectingScreen(); break;
        case AppState::DISCONNECTED:  displayDisconnectedScreen(); break;
        case AppState::CONFIG_ERROR:  displayErrorScreen("Config ERROR", "Fix the config file and reboot"); break;
        case AppState::BLE_ERROR:     displayErrorScreen("BLE ERROR", "Reboot the device"); break;
        case AppState::INITIALIZING:  return; // setupでshowMessageされるので何もしない
    }
    sprite.pushSprite(0, 0);
}

// 値(大) + ラベル(小) を1項目描く
void Display::drawField(int x, int y, const char* label, const std::string& value) {
    sprite.setTextDatum(TL_DATUM);
    sprite.setTextColor(TFT_WHITE, TFT_BLACK);
    sprite.setCursor(x, y); sprite.setTextSize(2); sprite.print(value.c_str());
    sprite.setTextSize(1); sprite.setCursor(x, y + 28); sprite.print(label);
}

// 接続中のダッシュボード
void Display::displayDashboardScreen() {
    const DerivedDisplay& data = currentDisplay;
    sprite.fillSprite(BLACK);
    sprite.setTextDatum(TL_DATUM);
    sprite.setTextSize(1); sprite.setTextFont(2);
    sprite.setCursor(5, 5);
    if (shownState == AppState::RUNNING) { sprite.setTextColor(TFT_GREEN, TFT_BLACK); sprite.print("RUNNING"); }
    else { sprite.setTextColor(TFT_YELLOW, TFT_BLACK); sprite.print("IDLE"); }

    // BLE Status (右上に表示)
    sprite.setTextDatum(TR_DATUM);
    sprite.setTextColor(TFT_GREEN, TFT_BLACK);
    sprite.drawString("BLE OK", sprite.width() - 5, 5);

    // --- メトリクス表示 ---
    int row1_y = 30; int row2_y = 80; int row3_y = 130; int col1_x = 10; int col2_x = 170;
    drawField(col1_x, row1_y, "Duration", data.durationText);
    drawField(col2_x, row1_y, "Speed km/h", data.speedText);
    drawField(col1_x, row2_y, "Distance m", data.distanceText);
    drawField(col2_x, row2_y, "Calories kcal", data.caloriesText);
    drawField(col1_x, row3_y, "Steps", data.stepsText);

    // --- 通知 (コマンド失敗など) ---
    if (notice.length() > 0) {
        sprite.setTextDatum(TL_DATUM);
        sprite.setTextColor(TFT_RED, TFT_BLACK);
        sprite.setCursor(col2_x, row3_y + 10);
        sprite.print(notice);
    }

    // --- フッター (ボタン説明) ---
    sprite.drawFastHLine(0, sprite.height() - 30, sprite.width(), TFT_DARKGREY);
    sprite.setTextColor(TFT_WHITE, TFT_BLACK);
    sprite.setTextDatum(BC_DATUM);
    sprite.drawString("A:Stop  B:-  C:+ (hold C:Start)", sprite.width() / 2, sprite.height() - 8);
    sprite.setTextDatum(TL_DATUM);
}

// 接続中
void Display::displayConnectingScreen() {
    sprite.fillSprite(TFT_NAVY);
    sprite.setTextColor(TFT_WHITE, TFT_NAVY);
    sprite.setTextFont(4); sprite.setTextSize(1);
    sprite.setTextDatum(MC_DATUM);
    sprite.drawString("Connecting...", sprite.width() / 2, sprite.height() / 2);
    sprite.setTextFont(2);
    sprite.setTextDatum(TL_DATUM);
}

// 切断中
void Display::displayDisconnectedScreen() {
    sprite.fillSprite(TFT_DARKGREY);
    sprite.setTextColor(TFT_YELLOW, TFT_DARKGREY);
    sprite.setTextFont(4); sprite.setTextSize(1);
    sprite.setTextDatum(MC_DATUM);
    sprite.drawString("Disconnected", sprite.width() / 2, 60);

    sprite.setTextFont(2);
    sprite.setTextColor(TFT_WHITE, TFT_DARKGREY);
    if (notice.length() > 0) {
        sprite.drawString(notice, sprite.width() / 2, 110);
    }
    sprite.setTextDatum(BC_DATUM);
    sprite.drawString("B: Connect", sprite.width() / 2, sprite.height() - 10);
    sprite.setTextDatum(TL_DATUM);
}

// 起動時エラー (ここからは抜けない)
void Display::displayErrorScreen(const char* title, const char* hint) {
    sprite.fillSprite(TFT_MAROON);
    sprite.setTextColor(TFT_WHITE, TFT_MAROON);
    sprite.setTextFont(4); sprite.setTextSize(1);
    sprite.setTextDatum(MC_DATUM);
    sprite.drawString(title, sprite.width() / 2, 60);
    sprite.setTextFont(2);
    if (errorDetail.length() > 0) {
        sprite.drawString(errorDetail, sprite.width() / 2, 110);
    }
    sprite.drawString(hint, sprite.width() / 2, 140);
    sprite.setTextDatum(TL_DATUM);
}
