#pragma once

#include <cstddef>  // for size_t

namespace coderun {

constexpr const char* SERVICE_VERSION = "1.0.0";

// Execution environment
constexpr const char* DEFAULT_IMAGE = "golang:1.21";
constexpr const char* DEFAULT_WORKING_DIR = "/app";
constexpr const char* DEFAULT_SOURCE_FILENAME = "main.go";
constexpr unsigned SOURCE_FILE_MODE = 0644;

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 10;                       // Per session deadline
constexpr int LOG_DRAIN_GRACE_MS = 2000;                          // Output drain after exit
constexpr int CLEANUP_TIMEOUT_SECONDS = 10;                       // Forced removal bound
constexpr int RUNTIME_POLL_INTERVAL_MS = 50;                      // Cancellation check slice

// Output limits
constexpr size_t MAX_OUTPUT_FRAME_SIZE = 16 * 1024 * 1024;       // 16MB per multiplexed frame
constexpr size_t MAX_RUNTIME_RESPONSE_SIZE = 16 * 1024 * 1024;   // Buffered runtime replies

// Container runtime
constexpr const char* DEFAULT_DOCKER_SOCKET = "/var/run/docker.sock";
constexpr const char* DEFAULT_DOCKER_API_VERSION = "1.43";

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer
constexpr size_t TAR_BLOCK_SIZE = 512;                           // ustar record block

// Network
constexpr int DEFAULT_PORT = 4000;                               // Default server port
constexpr int LISTEN_BACKLOG = 64;                               // Socket listen backlog
constexpr size_t MAX_REQUEST_SIZE = 10 * 1024 * 1024;            // 10MB max request
constexpr size_t MAX_WEBSOCKET_MESSAGE_SIZE = 10 * 1024 * 1024;  // 10MB max inbound frame
constexpr int HTTP_IO_TIMEOUT_MS = 10000;                        // Idle limit on a plain HTTP connection
constexpr int WEBSOCKET_IO_TIMEOUT_MS = 5000;                    // Bounds a single frame read or write

} // namespace coderun
