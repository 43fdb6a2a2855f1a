#ifndef RENDER_SINK_HPP
#define RENDER_SINK_HPP

#include <string>
#include "DisplayFormatter.hpp"

// 表示先の抽象。受け取った値を描くだけで、計算はしない
class RenderSink {
public:
    virtual ~RenderSink() {}

    // 最新のテレメトリ表示を渡す (コンシューマタスクから呼ばれる)
    virtual void publish(const DerivedDisplay& display) = 0;

    // コマンド失敗などの一時的な通知 (UIタスクから呼ばれる)
    virtual void showNotice(const std::string& message) = 0;
};

#endif // RENDER_SINK_HPP
