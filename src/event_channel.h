#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace coderun {

// Unbounded multi-producer queue used by session worker threads to report
// to the controlling thread
template <typename T>
class EventChannel {
public:
    void push(T event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    // Wait until an event is available or the time point passes
    std::optional<T> pop_until(std::chrono::steady_clock::time_point until) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_until(lock, until, [this] { return !events_.empty(); })) {
            return std::nullopt;
        }
        T event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> events_;
};

} // namespace coderun
