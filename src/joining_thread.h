#pragma once

#include <thread>
#include <utility>

namespace coderun {

// std::thread that joins in its destructor, so no worker outlives its scope
class JoiningThread {
public:
    template <typename Fn>
    explicit JoiningThread(Fn&& fn) : thread_(std::forward<Fn>(fn)) {}

    ~JoiningThread() { join(); }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    JoiningThread(const JoiningThread&) = delete;
    JoiningThread& operator=(const JoiningThread&) = delete;

private:
    std::thread thread_;
};

} // namespace coderun
