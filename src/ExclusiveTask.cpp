#include "ExclusiveTask.hpp"

ExclusiveTask::ExclusiveTask(const char* name) :
    taskName(name), running(false), startCount(0)
{}

ExclusiveTask::~ExclusiveTask() {
    cancelAndJoin();
}

void ExclusiveTask::start(Body body) {
    std::lock_guard<std::mutex> lock(controlMutex);
    stopLocked(); // 前のインスタンスは必ず止めてから

    std::shared_ptr<CancelToken> newToken(new CancelToken());
    token = newToken;
    running.store(true);
    ++startCount;
    worker = std::thread([this, body, newToken]() {
        body(*newToken);
        running.store(false);
    });
}

void ExclusiveTask::cancelAndJoin() {
    std::lock_guard<std::mutex> lock(controlMutex);
    stopLocked();
}

bool ExclusiveTask::isRunning() const {
    return running.load();
}

void ExclusiveTask::stopLocked() {
    if (token) token->cancel();
    if (worker.joinable()) worker.join(); // 本体がキャンセルを検知して戻るまで待つ
    token.reset();
}
