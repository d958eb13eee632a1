#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace coderun {

// Lifecycle of one execution session
enum class SessionState {
    CREATED,
    INJECTED,
    RUNNING,
    SUCCEEDED,
    FAILED,
    TIMED_OUT,
    CANCELLED
};

const char* session_state_name(SessionState state);
bool is_terminal(SessionState state);

enum class StreamType {
    STDOUT,
    STDERR
};

const char* stream_type_name(StreamType stream);

// Source text submitted by a caller
struct ExecutionRequest {
    std::string source_text;
};

// One decoded piece of container output. Sequence numbers are counted
// per stream and start at zero.
struct OutputChunk {
    StreamType stream = StreamType::STDOUT;
    std::string bytes;
    uint64_t sequence = 0;
};

enum class ResultStatus {
    SUCCESS,
    ERROR,
    TIMEOUT
};

const char* result_status_name(ResultStatus status);

// Terminal artifact returned to the caller
struct ExecutionResult {
    ResultStatus status = ResultStatus::ERROR;
    std::string output;
    int exit_code = -1;
};

// Runtime-side environment driven by one orchestrator run
struct Session {
    std::string container_id;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point deadline;
    SessionState state = SessionState::CREATED;
    bool cleaned_up = false;
};

} // namespace coderun
