#include "execution_context.h"
#include "errors.h"

namespace coderun {

ExecutionContext::ExecutionContext(Clock::time_point deadline) : deadline_(deadline) {}

std::chrono::milliseconds ExecutionContext::remaining() const {
    auto now = Clock::now();
    if (now >= deadline_) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
}

bool ExecutionContext::expired() const {
    return Clock::now() >= deadline_;
}

bool ExecutionContext::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_ != CancelReason::NONE;
}

bool ExecutionContext::done() const {
    return cancelled() || expired();
}

CancelReason ExecutionContext::cancel_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

void ExecutionContext::cancel(CancelReason reason) {
    if (reason == CancelReason::NONE) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reason_ != CancelReason::NONE) return;
        reason_ = reason;
    }
    cv_.notify_all();
}

void ExecutionContext::throw_if_done() const {
    switch (cancel_reason()) {
        case CancelReason::CLIENT_DISCONNECTED:
            throw ClientDisconnected();
        case CancelReason::ABANDONED:
            throw OperationAbandoned();
        case CancelReason::NONE:
            break;
    }
    if (expired()) {
        throw DeadlineExceeded();
    }
}

bool ExecutionContext::wait_for(std::chrono::milliseconds timeout) const {
    auto until = Clock::now() + timeout;
    if (until > deadline_) until = deadline_;

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, until, [this] { return reason_ != CancelReason::NONE; });
    bool was_cancelled = reason_ != CancelReason::NONE;
    lock.unlock();
    return was_cancelled || expired();
}

} // namespace coderun
