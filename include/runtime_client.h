#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include "execution_context.h"

namespace coderun {

// Environment definition passed to create_container
struct ContainerSpec {
    std::string image;
    std::vector<std::string> command;
    std::string working_dir;
    bool tty = false;
};

// Receives raw output bytes as the runtime delivers them
using ByteHandler = std::function<void(const char* data, size_t len)>;

// Capability interface over the container runtime. Implementations must be
// safe to share between concurrent sessions; each call is independent.
// Blocking calls honour the context and throw DeadlineExceeded,
// ClientDisconnected or OperationAbandoned once it is done. Runtime
// failures are reported as RuntimeError.
class RuntimeClient {
public:
    virtual ~RuntimeClient() = default;

    // Returns the runtime-assigned container id. Once the runtime may have
    // created the container, the call returns its id even if ctx finishes
    // meanwhile, so the caller can remove it.
    virtual std::string create_container(const ContainerSpec& spec,
                                         const ExecutionContext& ctx) = 0;

    // Extract a tar archive into the container filesystem at path
    virtual void copy_archive(const std::string& container_id,
                              const std::string& path,
                              const std::vector<uint8_t>& archive,
                              const ExecutionContext& ctx) = 0;

    virtual void start_container(const std::string& container_id,
                                 const ExecutionContext& ctx) = 0;

    // Deliver the combined output stream to on_bytes. With follow set the
    // call returns only when the stream ends.
    virtual void stream_logs(const std::string& container_id,
                             bool follow,
                             const ByteHandler& on_bytes,
                             const ExecutionContext& ctx) = 0;

    // Block until the process exits and return its exit code
    virtual int wait_container(const std::string& container_id,
                               const ExecutionContext& ctx) = 0;

    // Not bound to a context: cleanup runs after the deadline has passed.
    // Removing a container that no longer exists is not an error.
    virtual void remove_container(const std::string& container_id, bool force) = 0;
};

} // namespace coderun
