#ifndef COMMAND_DISPATCHER_HPP
#define COMMAND_DISPATCHER_HPP

#include <atomic>
#include "config.hpp"
#include "DeviceController.hpp"
#include "RenderSink.hpp"

// ユーザー操作の種類
enum class ControlIntent {
    Start,
    Stop,
    IncreaseSpeed,
    DecreaseSpeed
};

// 速度ステップ (ボタン1回あたり。増加と減少で大きさは別)
struct SpeedSteps {
    int increase = DEFAULT_SPEED_STEP_UP;
    int decrease = DEFAULT_SPEED_STEP_DOWN;
};

const char* intentName(ControlIntent intent);

// 操作をそのまま DeviceController の呼び出しに変換する。
// 失敗は RenderSink に一時通知するだけで、パイプラインには影響しない。
// 応答待ちで止まるので、描画やテレメトリとは別のタスクから呼ぶこと。
class CommandDispatcher {
public:
    CommandDispatcher(DeviceController& controller, RenderSink& feedback, const SpeedSteps& steps);

    bool dispatch(ControlIntent intent);

    unsigned long getFailureCount() const { return failureCount.load(); }

private:
    DeviceController& controller;
    RenderSink& feedback;
    const SpeedSteps& steps;
    std::atomic<unsigned long> failureCount; // loop() のデバッグ出力から読む
};

#endif // COMMAND_DISPATCHER_HPP
