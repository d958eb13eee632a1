#include "output_demux.h"
#include "constants.h"
#include "errors.h"

namespace coderun {

namespace {

constexpr uint8_t STREAM_STDIN = 0;
constexpr uint8_t STREAM_STDOUT = 1;
constexpr uint8_t STREAM_STDERR = 2;

} // namespace

OutputDemuxer::OutputDemuxer(StreamFraming framing, OutputSink& sink)
    : framing_(framing), sink_(sink) {}

void OutputDemuxer::feed(const char* data, size_t len) {
    if (failed_) {
        throw StreamDecodeError("output stream already failed");
    }
    if (finished_) {
        throw StreamDecodeError("output received after end of stream");
    }
    if (len == 0) return;

    if (framing_ == StreamFraming::RAW) {
        emit(StreamType::STDOUT, std::string(data, len));
        return;
    }

    pending_.append(data, len);
    decode_frames();
}

void OutputDemuxer::finish() {
    if (failed_) {
        throw StreamDecodeError("output stream already failed");
    }
    finished_ = true;
    if (!pending_.empty()) {
        fail("output stream ended inside a frame (" + std::to_string(pending_.size()) +
             " bytes pending)");
    }
}

void OutputDemuxer::decode_frames() {
    size_t pos = 0;
    while (pending_.size() - pos >= FRAME_HEADER_SIZE) {
        const auto* header = reinterpret_cast<const uint8_t*>(pending_.data() + pos);

        uint8_t type = header[0];
        if (type != STREAM_STDIN && type != STREAM_STDOUT && type != STREAM_STDERR) {
            fail("unknown stream type " + std::to_string(type));
        }
        if (header[1] != 0 || header[2] != 0 || header[3] != 0) {
            fail("malformed frame header");
        }

        size_t size = (static_cast<size_t>(header[4]) << 24) |
                      (static_cast<size_t>(header[5]) << 16) |
                      (static_cast<size_t>(header[6]) << 8) |
                      static_cast<size_t>(header[7]);
        if (size > MAX_OUTPUT_FRAME_SIZE) {
            fail("frame of " + std::to_string(size) + " bytes exceeds limit");
        }

        if (pending_.size() - pos - FRAME_HEADER_SIZE < size) {
            break;  // Wait for the rest of the frame
        }

        StreamType stream = (type == STREAM_STDERR) ? StreamType::STDERR : StreamType::STDOUT;
        if (size > 0) {
            emit(stream, pending_.substr(pos + FRAME_HEADER_SIZE, size));
        }
        pos += FRAME_HEADER_SIZE + size;
    }
    pending_.erase(0, pos);
}

void OutputDemuxer::emit(StreamType stream, std::string bytes) {
    OutputChunk chunk;
    chunk.stream = stream;
    chunk.sequence = next_sequence_[stream == StreamType::STDERR ? 1 : 0]++;
    chunk.bytes = std::move(bytes);

    bytes_emitted_ += chunk.bytes.size();
    chunks_emitted_++;
    sink_.write(chunk);
}

void OutputDemuxer::fail(const std::string& reason) {
    failed_ = true;
    pending_.clear();
    throw StreamDecodeError(reason);
}

} // namespace coderun
