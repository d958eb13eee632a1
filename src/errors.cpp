#include "errors.h"

namespace coderun {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PACKAGING: return "PackagingError";
        case ErrorKind::ENVIRONMENT_CREATE: return "EnvironmentCreateError";
        case ErrorKind::INJECTION: return "InjectionError";
        case ErrorKind::START: return "StartError";
        case ErrorKind::RUNTIME_WAIT: return "RuntimeWaitError";
        case ErrorKind::STREAM_DECODE: return "StreamDecodeError";
        case ErrorKind::DEADLINE_EXCEEDED: return "DeadlineExceeded";
        case ErrorKind::CLIENT_DISCONNECTED: return "ClientDisconnected";
        case ErrorKind::CLEANUP: return "CleanupError";
    }
    return "UnknownError";
}

void throw_execution_error(ErrorKind kind, const std::string& message) {
    switch (kind) {
        case ErrorKind::PACKAGING: throw PackagingError(message);
        case ErrorKind::ENVIRONMENT_CREATE: throw EnvironmentCreateError(message);
        case ErrorKind::INJECTION: throw InjectionError(message);
        case ErrorKind::START: throw StartError(message);
        case ErrorKind::RUNTIME_WAIT: throw RuntimeWaitError(message);
        case ErrorKind::STREAM_DECODE: throw StreamDecodeError(message);
        case ErrorKind::DEADLINE_EXCEEDED: throw DeadlineExceeded(message);
        case ErrorKind::CLIENT_DISCONNECTED: throw ClientDisconnected(message);
        case ErrorKind::CLEANUP: throw CleanupError(message);
    }
    throw ExecutionError(kind, message);
}

} // namespace coderun
