#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace coderun {

enum class CancelReason {
    NONE,
    CLIENT_DISCONNECTED,   // Transport lost its peer or the peer asked to stop
    ABANDONED              // Owner decided the outcome and no longer needs the result
};

// Deadline and cancellation signal shared by every step of one session.
// Created before the environment is created and passed into every
// runtime call. Thread-safe.
class ExecutionContext {
public:
    using Clock = std::chrono::steady_clock;

    explicit ExecutionContext(Clock::time_point deadline);

    static ExecutionContext with_timeout(std::chrono::milliseconds timeout) {
        return ExecutionContext(Clock::now() + timeout);
    }

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    Clock::time_point deadline() const { return deadline_; }

    // Time left before the deadline, zero once it has passed
    std::chrono::milliseconds remaining() const;

    bool expired() const;
    bool cancelled() const;

    // Cancelled or expired
    bool done() const;

    CancelReason cancel_reason() const;

    // The first reason wins, later calls are ignored
    void cancel(CancelReason reason);

    // Throws DeadlineExceeded, ClientDisconnected or OperationAbandoned
    // when the context is done
    void throw_if_done() const;

    // Blocks until the context is done or the timeout elapses.
    // Returns done().
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    Clock::time_point deadline_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    CancelReason reason_ = CancelReason::NONE;
};

} // namespace coderun
