#include "execution.h"

namespace coderun {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::CREATED: return "created";
        case SessionState::INJECTED: return "injected";
        case SessionState::RUNNING: return "running";
        case SessionState::SUCCEEDED: return "succeeded";
        case SessionState::FAILED: return "failed";
        case SessionState::TIMED_OUT: return "timed_out";
        case SessionState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(SessionState state) {
    return state == SessionState::SUCCEEDED || state == SessionState::FAILED ||
           state == SessionState::TIMED_OUT || state == SessionState::CANCELLED;
}

const char* stream_type_name(StreamType stream) {
    return stream == StreamType::STDERR ? "stderr" : "stdout";
}

const char* result_status_name(ResultStatus status) {
    switch (status) {
        case ResultStatus::SUCCESS: return "success";
        case ResultStatus::ERROR: return "error";
        case ResultStatus::TIMEOUT: return "timeout";
    }
    return "error";
}

} // namespace coderun
