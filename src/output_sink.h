#pragma once

#include <string>
#include <mutex>
#include <functional>
#include "execution.h"

namespace coderun {

// Destination of decoded output chunks. The orchestrator writes from its
// log-streaming thread only.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    // May throw ClientDisconnected when the consumer has gone away
    virtual void write(const OutputChunk& chunk) = 0;
};

// Synchronous mode: interleaves every chunk into one buffer in arrival order
class AccumulatingSink : public OutputSink {
public:
    void write(const OutputChunk& chunk) override;

    std::string output() const;
    size_t chunk_count() const;

private:
    mutable std::mutex mutex_;
    std::string buffer_;
    size_t chunks_ = 0;
};

// Streaming mode: hands each chunk to a callback as soon as it is decoded
class CallbackSink : public OutputSink {
public:
    using Callback = std::function<void(const OutputChunk&)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

    void write(const OutputChunk& chunk) override { callback_(chunk); }

private:
    Callback callback_;
};

// Forwards to another sink until closed; writes after close() are dropped.
// close() waits for an in-flight write, so nothing reaches the target once
// it returns.
class GatedSink : public OutputSink {
public:
    explicit GatedSink(OutputSink& target) : target_(target) {}

    void write(const OutputChunk& chunk) override;

    void close();
    bool closed() const;
    size_t dropped() const;

private:
    OutputSink& target_;
    mutable std::mutex mutex_;
    bool closed_ = false;
    size_t dropped_ = 0;
};

} // namespace coderun
