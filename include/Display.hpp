#ifndef DISPLAY_HPP
#define DISPLAY_HPP

#include <M5Stack.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <atomic>
#include "config.hpp"
#include "RenderSink.hpp"

// M5Stack LCD への描画。
// publish() はコンシューマタスクから呼ばれ、届いたフレームを順にその場で描く。
// update() は loop() から呼ばれ、状態の切り替わりと通知の期限切れのときだけ描き直す。
// Sprite と表示状態はすべて drawMutex の内側で触る。
class Display : public RenderSink {
public:
    Display();
    void begin(); // ディスプレイとSpriteの初期化
    void update(AppState state);
    void showMessage(const String& msg, int size = 2, bool clear = true); // 起動中のメッセージ表示用
    void setErrorDetail(const String& detail); // エラー画面に出す理由

    // RenderSink
    void publish(const DerivedDisplay& display) override;
    void showNotice(const std::string& message) override;

    void resetTelemetry(); // 新しいセッション開始時に表示値をゼロに戻す
    unsigned long getDrawnFrameCount() const { return drawnFrames.load(); }

private:
    TFT_eSprite sprite; // ちらつき防止用Sprite
    SemaphoreHandle_t drawMutex;

    DerivedDisplay currentDisplay;   // 最後に受け取ったフレーム
    AppState shownState;             // 画面に出している状態
    String notice;                   // 一時通知
    unsigned long noticeUntilMs;     // 通知の表示期限
    String errorDetail;
    std::atomic<unsigned long> drawnFrames; // ダッシュボードに描いたフレーム数

    bool lock();
    void unlock();
    void renderLocked();

    // 画面描画用プライベートメソッド
    void displayDashboardScreen();
    void displayConnectingScreen();
    void displayDisconnectedScreen();
    void displayErrorScreen(const char* title, const char* hint);

    void drawField(int x, int y, const char* label, const std::string& value);
};

#endif // DISPLAY_HPP
