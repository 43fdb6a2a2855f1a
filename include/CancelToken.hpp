#ifndef CANCEL_TOKEN_HPP
#define CANCEL_TOKEN_HPP

#include <atomic>

// タスク停止要求フラグ。待機を伴う呼び出しには必ずこれを渡す
class CancelToken {
public:
    CancelToken() : cancelled(false) {}

    void cancel() { cancelled.store(true); }
    bool isCancelled() const { return cancelled.load(); }

private:
    std::atomic<bool> cancelled;

    CancelToken(const CancelToken&);            // コピー禁止
    CancelToken& operator=(const CancelToken&);
};

#endif // CANCEL_TOKEN_HPP
