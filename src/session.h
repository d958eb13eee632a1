#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <optional>
#include "constants.h"
#include "errors.h"
#include "execution.h"
#include "execution_context.h"
#include "runtime_client.h"
#include "output_demux.h"
#include "output_sink.h"

namespace coderun {

// Entry command used unless one is configured: runs the injected file
std::vector<std::string> default_command(const std::string& source_filename);

// Execution environment and limits applied to every session
struct SessionConfig {
    std::string image = DEFAULT_IMAGE;
    std::vector<std::string> command = default_command(DEFAULT_SOURCE_FILENAME);
    std::string working_dir = DEFAULT_WORKING_DIR;
    std::string source_filename = DEFAULT_SOURCE_FILENAME;
    bool tty = false;                                 // TTY containers merge stdout and stderr
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_SECONDS * 1000};
    std::chrono::milliseconds drain_grace{LOG_DRAIN_GRACE_MS};
};

// What one session produced. error is set for every outcome other than a
// completed run (SUCCEEDED or FAILED).
struct SessionOutcome {
    SessionState state = SessionState::FAILED;
    ExecutionResult result;
    std::optional<ErrorKind> error;
    std::string message;
    std::string container_id;

    bool completed() const {
        return !error && (state == SessionState::SUCCEEDED || state == SessionState::FAILED);
    }
};

// Drives one submitted snippet through
// package -> create -> inject -> start -> stream+wait -> cleanup.
// Stateless across runs; one instance may serve concurrent requests.
class SessionOrchestrator {
public:
    explicit SessionOrchestrator(RuntimeClient& runtime, SessionConfig config = SessionConfig{});

    // Full lifecycle. Chunks are written to sink as they are decoded.
    // Never throws for session failures; they are reported in the outcome.
    SessionOutcome run(const ExecutionRequest& request, OutputSink& sink, ExecutionContext& ctx);

    // Synchronous mode: run() with output accumulated into result.output
    SessionOutcome execute(const ExecutionRequest& request, ExecutionContext& ctx);

    // Context carrying the configured deadline, starting now
    std::unique_ptr<ExecutionContext> new_context() const;

    // Lifecycle steps. create_session stores the container id in session
    // before it checks ctx, so a guard over session removes a container
    // whose creation outlived the deadline.
    void create_session(Session& session, const ExecutionContext& ctx);
    void inject_payload(Session& session, const std::vector<uint8_t>& archive,
                        const ExecutionContext& ctx);
    void start(Session& session, const ExecutionContext& ctx);
    ExecutionResult run_and_collect(Session& session, ExecutionContext& ctx, OutputSink& sink);

    // Forced removal. Failures are logged, never thrown. Safe to call twice.
    void cleanup(Session& session);

    const SessionConfig& config() const { return config_; }
    StreamFraming framing() const;

private:
    RuntimeClient& runtime_;
    SessionConfig config_;
};

// Scoped ownership of a created container: cleanup runs on every exit path
class ContainerGuard {
public:
    ContainerGuard(SessionOrchestrator& orchestrator, Session& session)
        : orchestrator_(orchestrator), session_(session) {}

    ~ContainerGuard() { orchestrator_.cleanup(session_); }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    SessionOrchestrator& orchestrator_;
    Session& session_;
};

} // namespace coderun
