#ifndef EXCLUSIVE_TASK_HPP
#define EXCLUSIVE_TASK_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include "CancelToken.hpp"

// 常に高々1インスタンスしか動かない長寿命タスク。
// start() は前のインスタンスをキャンセルし、終了を待ってから新しく起動する。
class ExclusiveTask {
public:
    typedef std::function<void(const CancelToken&)> Body;

    explicit ExclusiveTask(const char* name);
    ~ExclusiveTask(); // 動作中ならキャンセルして終了を待つ

    void start(Body body);
    void cancelAndJoin();     // キャンセル要求を出し、本体が戻るまで待つ
    bool isRunning() const;   // 本体が実行中か
    unsigned long getStartCount() const { return startCount; }
    const char* getName() const { return taskName; }

private:
    const char* taskName;
    std::mutex controlMutex;             // start/cancelAndJoin の直列化
    std::thread worker;
    std::shared_ptr<CancelToken> token;  // 現在のインスタンスのトークン
    std::atomic<bool> running;
    unsigned long startCount;

    void stopLocked();

    ExclusiveTask(const ExclusiveTask&);
    ExclusiveTask& operator=(const ExclusiveTask&);
};

#endif // EXCLUSIVE_TASK_HPP
