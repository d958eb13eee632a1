#include "output_sink.h"

namespace coderun {

void AccumulatingSink::write(const OutputChunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ += chunk.bytes;
    chunks_++;
}

std::string AccumulatingSink::output() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

size_t AccumulatingSink::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
}

void GatedSink::write(const OutputChunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        dropped_++;
        return;
    }
    target_.write(chunk);
}

void GatedSink::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool GatedSink::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t GatedSink::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace coderun
