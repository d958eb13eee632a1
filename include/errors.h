#pragma once

#include <stdexcept>
#include <string>

namespace coderun {

// Failure taxonomy of an execution session
enum class ErrorKind {
    PACKAGING,
    ENVIRONMENT_CREATE,
    INJECTION,
    START,
    RUNTIME_WAIT,
    STREAM_DECODE,
    DEADLINE_EXCEEDED,
    CLIENT_DISCONNECTED,
    CLEANUP
};

const char* error_kind_name(ErrorKind kind);

// Throw the ExecutionError subclass matching kind
[[noreturn]] void throw_execution_error(ErrorKind kind, const std::string& message);

// Base class for every error a session step can raise
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class PackagingError : public ExecutionError {
public:
    explicit PackagingError(const std::string& message)
        : ExecutionError(ErrorKind::PACKAGING, message) {}
};

class EnvironmentCreateError : public ExecutionError {
public:
    explicit EnvironmentCreateError(const std::string& message)
        : ExecutionError(ErrorKind::ENVIRONMENT_CREATE, message) {}
};

class InjectionError : public ExecutionError {
public:
    explicit InjectionError(const std::string& message)
        : ExecutionError(ErrorKind::INJECTION, message) {}
};

class StartError : public ExecutionError {
public:
    explicit StartError(const std::string& message)
        : ExecutionError(ErrorKind::START, message) {}
};

class RuntimeWaitError : public ExecutionError {
public:
    explicit RuntimeWaitError(const std::string& message)
        : ExecutionError(ErrorKind::RUNTIME_WAIT, message) {}
};

class StreamDecodeError : public ExecutionError {
public:
    explicit StreamDecodeError(const std::string& message)
        : ExecutionError(ErrorKind::STREAM_DECODE, message) {}
};

class DeadlineExceeded : public ExecutionError {
public:
    explicit DeadlineExceeded(const std::string& message = "execution deadline exceeded")
        : ExecutionError(ErrorKind::DEADLINE_EXCEEDED, message) {}
};

class ClientDisconnected : public ExecutionError {
public:
    explicit ClientDisconnected(const std::string& message = "client disconnected")
        : ExecutionError(ErrorKind::CLIENT_DISCONNECTED, message) {}
};

class CleanupError : public ExecutionError {
public:
    explicit CleanupError(const std::string& message)
        : ExecutionError(ErrorKind::CLEANUP, message) {}
};

// Raised by a blocking call whose context was cancelled by its owner after
// the session outcome was already decided. Never surfaced to a caller.
class OperationAbandoned : public std::runtime_error {
public:
    OperationAbandoned() : std::runtime_error("operation abandoned") {}
};

// Raised by RuntimeClient implementations when the container runtime
// rejects a call or cannot be reached
class RuntimeError : public std::runtime_error {
public:
    explicit RuntimeError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    // HTTP status returned by the runtime, 0 if none was received
    int status_code() const { return status_code_; }

private:
    int status_code_;
};

} // namespace coderun
