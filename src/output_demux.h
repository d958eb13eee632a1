#pragma once

#include <string>
#include <cstdint>
#include "execution.h"
#include "output_sink.h"

namespace coderun {

// How the runtime encodes the combined output stream
enum class StreamFraming {
    MULTIPLEXED,   // 8-byte header per frame: [type, 0, 0, 0, size (big endian u32)]
    RAW            // TTY containers: one merged stream, no headers
};

// Incremental decoder for the runtime's combined stdout/stderr stream.
// Frames may arrive split across any number of feed() calls. Each decoded
// chunk is written to the sink immediately; only an incomplete frame is
// held back. After a decode error the demuxer stays failed and forwards
// nothing more.
class OutputDemuxer {
public:
    OutputDemuxer(StreamFraming framing, OutputSink& sink);

    // Throws StreamDecodeError on a malformed frame
    void feed(const char* data, size_t len);

    // Signal end of stream. Throws StreamDecodeError if it ends inside a frame.
    void finish();

    bool failed() const { return failed_; }
    uint64_t chunks_emitted() const { return chunks_emitted_; }
    uint64_t bytes_emitted() const { return bytes_emitted_; }

    static constexpr size_t FRAME_HEADER_SIZE = 8;

private:
    void decode_frames();
    void emit(StreamType stream, std::string bytes);
    [[noreturn]] void fail(const std::string& reason);

    StreamFraming framing_;
    OutputSink& sink_;
    std::string pending_;
    uint64_t next_sequence_[2] = {0, 0};
    uint64_t chunks_emitted_ = 0;
    uint64_t bytes_emitted_ = 0;
    bool failed_ = false;
    bool finished_ = false;
};

} // namespace coderun
