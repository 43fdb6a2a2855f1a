#ifndef DEVICE_CONTROLLER_HPP
#define DEVICE_CONTROLLER_HPP

#include "CancelToken.hpp"
#include "TelemetryChannel.hpp"

// トレッドミル側の操作窓口。
// start/stop/setSpeed は通信エラー時に false を返す (ログは実装側で出す)。
class DeviceController {
public:
    virtual ~DeviceController() {}

    virtual bool start() = 0;
    virtual bool stop() = 0;
    // step はプロトコル側で定義される符号付きの調整単位
    virtual bool setSpeed(int step) = 0;

    // 接続中ずっと動く。通知をデコードして channel.put() する。
    // token がキャンセルされるか切断されたら購読を解除して戻る。
    virtual void subscribe(TelemetryChannel& channel, const CancelToken& token) = 0;
};

#endif // DEVICE_CONTROLLER_HPP
