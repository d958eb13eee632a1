#pragma once

#include <string>
#include <map>
#include <vector>
#include "constants.h"
#include "runtime_client.h"

namespace coderun {

struct DockerClientConfig {
    std::string socket_path = DEFAULT_DOCKER_SOCKET;
    std::string api_version = DEFAULT_DOCKER_API_VERSION;
};

// Parsed reply from the Docker daemon. Header names are lower-cased.
struct DockerResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;
};

// Incremental decoder for HTTP/1.1 chunked transfer coding
class ChunkedDecoder {
public:
    // Append decoded payload bytes to out. Returns true once the final
    // zero-size chunk and its trailer have been consumed.
    // Throws RuntimeError on a malformed chunk header.
    bool feed(const char* data, size_t len, std::string& out);

    bool complete() const { return state_ == State::DONE; }

private:
    enum class State { SIZE, DATA, DATA_END, TRAILER, DONE };

    State state_ = State::SIZE;
    std::string line_;
    size_t remaining_ = 0;
};

// Docker Engine API client speaking HTTP/1.1 over the daemon's unix socket.
// Every call opens its own connection, so one instance can be shared by
// concurrent sessions.
class DockerClient : public RuntimeClient {
public:
    explicit DockerClient(DockerClientConfig config = DockerClientConfig{});

    // Once the request has been sent the reply is awaited even if ctx
    // finishes, so the caller always learns the id of what it created
    std::string create_container(const ContainerSpec& spec,
                                 const ExecutionContext& ctx) override;

    void copy_archive(const std::string& container_id,
                      const std::string& path,
                      const std::vector<uint8_t>& archive,
                      const ExecutionContext& ctx) override;

    void start_container(const std::string& container_id,
                         const ExecutionContext& ctx) override;

    void stream_logs(const std::string& container_id,
                     bool follow,
                     const ByteHandler& on_bytes,
                     const ExecutionContext& ctx) override;

    int wait_container(const std::string& container_id,
                       const ExecutionContext& ctx) override;

    void remove_container(const std::string& container_id, bool force) override;

    // Daemon version string, used by main to check connectivity at startup
    std::string ping();

    const DockerClientConfig& config() const { return config_; }

    // Request path prefixed with the API version, e.g. /v1.43/containers/create
    std::string api_path(const std::string& path) const;

    // Protocol helpers (exposed for testing)
    static std::string build_create_body(const ContainerSpec& spec);
    static bool parse_response_head(const std::string& raw, DockerResponse& response,
                                    size_t& body_offset);
    static std::string error_message(const DockerResponse& response);
    static std::string url_encode(const std::string& value);

private:
    // Send one request and read the reply. With on_body set, a successful
    // reply body is streamed to it instead of being buffered. A null ctx
    // bounds the call by CLEANUP_TIMEOUT_SECONDS instead. With
    // finish_once_sent, ctx only applies until the request is on the wire;
    // the reply is then awaited under the same hard bound.
    DockerResponse perform(const std::string& method,
                           const std::string& path,
                           const std::string& content_type,
                           const char* body,
                           size_t body_len,
                           const ExecutionContext* ctx,
                           const ByteHandler* on_body = nullptr,
                           bool finish_once_sent = false) const;

    int connect_socket() const;

    DockerClientConfig config_;
};

} // namespace coderun
