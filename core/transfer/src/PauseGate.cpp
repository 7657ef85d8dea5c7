#include "PauseGate.h"

namespace NetLink {

void PauseGate::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!paused_) {
        paused_ = true;
        ++pauseCount_;
    }
}

void PauseGate::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = false;
    }
    cv_.notify_all();
}

bool PauseGate::isPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

bool PauseGate::waitIfPaused() {
    std::unique_lock<std::mutex> lock(mutex_);
    ++waiters_;
    cv_.wait(lock, [this] { return !paused_ || closed_; });
    --waiters_;
    return !closed_;
}

bool PauseGate::waitIfPaused(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    ++waiters_;
    bool open = cv_.wait_for(lock, timeout, [this] { return !paused_ || closed_; });
    --waiters_;
    return open && !closed_;
}

void PauseGate::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool PauseGate::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void PauseGate::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
        paused_ = false;
    }
    cv_.notify_all();
}

int PauseGate::waiters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_;
}

uint64_t PauseGate::pauseCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pauseCount_;
}

} // namespace NetLink
