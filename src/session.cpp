#include "session.h"
#include "event_channel.h"
#include "joining_thread.h"
#include "logger.h"
#include "tar_archive.h"
#include <algorithm>
#include <functional>
#include <sstream>
#include <thread>

namespace coderun {

namespace {

using Clock = std::chrono::steady_clock;

// Report from a worker thread to the controlling thread
struct WorkerEvent {
    enum class Type { EXITED, LOGS_DONE, FAILED, ABANDONED };

    Type type = Type::FAILED;
    int exit_code = 0;
    ErrorKind kind = ErrorKind::RUNTIME_WAIT;
    std::string message;

    static WorkerEvent exited(int code) {
        WorkerEvent event;
        event.type = Type::EXITED;
        event.exit_code = code;
        return event;
    }

    static WorkerEvent logs_done() {
        WorkerEvent event;
        event.type = Type::LOGS_DONE;
        return event;
    }

    static WorkerEvent failed(ErrorKind kind, const std::string& message) {
        WorkerEvent event;
        event.type = Type::FAILED;
        event.kind = kind;
        event.message = message;
        return event;
    }

    static WorkerEvent abandoned() {
        WorkerEvent event;
        event.type = Type::ABANDONED;
        return event;
    }
};

// Joins on destruction so no worker outlives the session
class ScopeExit {
public:
    explicit ScopeExit(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~ScopeExit() { fn_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    std::function<void()> fn_;
};

std::string short_id(const std::string& container_id) {
    return container_id.substr(0, 12);
}

bool is_race_signal(ErrorKind kind) {
    return kind == ErrorKind::DEADLINE_EXCEEDED || kind == ErrorKind::CLIENT_DISCONNECTED;
}

SessionState state_for_error(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DEADLINE_EXCEEDED: return SessionState::TIMED_OUT;
        case ErrorKind::CLIENT_DISCONNECTED: return SessionState::CANCELLED;
        default: return SessionState::FAILED;
    }
}

// Run one runtime call, translating runtime failures into the step's error.
// Deadline and cancellation errors pass through unchanged.
template <typename StepError, typename Fn>
auto run_step(const std::string& what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const ExecutionError&) {
        throw;
    } catch (const std::exception& e) {
        throw StepError(what + ": " + e.what());
    }
}

} // namespace

std::vector<std::string> default_command(const std::string& source_filename) {
    return {"go", "run", source_filename};
}

SessionOrchestrator::SessionOrchestrator(RuntimeClient& runtime, SessionConfig config)
    : runtime_(runtime), config_(std::move(config)) {}

StreamFraming SessionOrchestrator::framing() const {
    return config_.tty ? StreamFraming::RAW : StreamFraming::MULTIPLEXED;
}

std::unique_ptr<ExecutionContext> SessionOrchestrator::new_context() const {
    return std::make_unique<ExecutionContext>(Clock::now() + config_.timeout);
}

void SessionOrchestrator::create_session(Session& session, const ExecutionContext& ctx) {
    ContainerSpec spec;
    spec.image = config_.image;
    spec.command = config_.command;
    spec.working_dir = config_.working_dir;
    spec.tty = config_.tty;

    ctx.throw_if_done();

    session.created_at = Clock::now();
    session.deadline = ctx.deadline();
    session.container_id = run_step<EnvironmentCreateError>("Failed to create container", [&] {
        return runtime_.create_container(spec, ctx);
    });
    if (session.container_id.empty()) {
        throw EnvironmentCreateError("Failed to create container: runtime returned no id");
    }
    session.state = SessionState::CREATED;

    log_info("[Session] container " + short_id(session.container_id) +
             " created from " + config_.image);

    // Creation may have finished after the deadline or a disconnect
    ctx.throw_if_done();
}

void SessionOrchestrator::inject_payload(Session& session, const std::vector<uint8_t>& archive,
                                         const ExecutionContext& ctx) {
    ctx.throw_if_done();
    run_step<InjectionError>("Failed to copy files to container", [&] {
        runtime_.copy_archive(session.container_id, config_.working_dir, archive, ctx);
    });
    session.state = SessionState::INJECTED;
}

void SessionOrchestrator::start(Session& session, const ExecutionContext& ctx) {
    ctx.throw_if_done();
    run_step<StartError>("Failed to start container", [&] {
        runtime_.start_container(session.container_id, ctx);
    });
    session.state = SessionState::RUNNING;
    log_info("[Session] container " + short_id(session.container_id) + " started");
}

ExecutionResult SessionOrchestrator::run_and_collect(Session& session, ExecutionContext& ctx,
                                                     OutputSink& sink) {
    const std::string container_id = session.container_id;
    EventChannel<WorkerEvent> events;
    GatedSink gate(sink);

    // Output task: decode the combined stream and forward chunks
    JoiningThread log_worker([this, &events, &gate, &ctx, container_id] {
        OutputDemuxer demux(framing(), gate);
        try {
            runtime_.stream_logs(container_id, true, [&demux](const char* data, size_t len) {
                demux.feed(data, len);
            }, ctx);
            demux.finish();
            events.push(WorkerEvent::logs_done());
        } catch (const ExecutionError& e) {
            events.push(WorkerEvent::failed(e.kind(), e.what()));
        } catch (const OperationAbandoned&) {
            events.push(WorkerEvent::abandoned());
        } catch (const std::exception& e) {
            events.push(WorkerEvent::failed(ErrorKind::RUNTIME_WAIT,
                std::string("Failed to read container output: ") + e.what()));
        }
    });

    // Exit task: block until the process leaves the running state
    JoiningThread wait_worker([this, &events, &ctx, container_id] {
        try {
            int exit_code = runtime_.wait_container(container_id, ctx);
            events.push(WorkerEvent::exited(exit_code));
        } catch (const ExecutionError& e) {
            events.push(WorkerEvent::failed(e.kind(), e.what()));
        } catch (const OperationAbandoned&) {
            events.push(WorkerEvent::abandoned());
        } catch (const std::exception& e) {
            events.push(WorkerEvent::failed(ErrorKind::RUNTIME_WAIT,
                std::string("Failed to wait for container: ") + e.what()));
        }
    });

    // Destroyed before the workers are joined: stop forwarding, then release
    // whatever they are still blocked on
    ScopeExit abandon([&gate, &ctx] {
        gate.close();
        ctx.cancel(CancelReason::ABANDONED);
    });

    const auto poll_interval = std::chrono::milliseconds(RUNTIME_POLL_INTERVAL_MS);
    bool exited = false;
    bool logs_done = false;
    int exit_code = -1;
    Clock::time_point drain_until;

    while (!(exited && logs_done)) {
        auto now = Clock::now();
        auto wake = now + poll_interval;

        if (exited) {
            // Exit decided the race; only wait a bounded time for the tail
            if (now >= drain_until) {
                log_warn("[Session] container " + short_id(container_id) +
                         " output did not close within " + format_duration(config_.drain_grace));
                break;
            }
            wake = std::min(wake, drain_until);
        } else {
            if (ctx.cancel_reason() == CancelReason::CLIENT_DISCONNECTED) {
                session.state = SessionState::CANCELLED;
                throw ClientDisconnected("client disconnected while container was running");
            }
            if (ctx.expired()) {
                session.state = SessionState::TIMED_OUT;
                throw DeadlineExceeded("execution exceeded deadline of " +
                                       format_duration(config_.timeout));
            }
            wake = std::min(wake, ctx.deadline());
        }

        auto event = events.pop_until(wake);
        if (!event) continue;

        switch (event->type) {
            case WorkerEvent::Type::EXITED:
                exited = true;
                exit_code = event->exit_code;
                drain_until = Clock::now() + config_.drain_grace;
                break;
            case WorkerEvent::Type::LOGS_DONE:
                logs_done = true;
                break;
            case WorkerEvent::Type::ABANDONED:
                break;
            case WorkerEvent::Type::FAILED:
                if (exited && is_race_signal(event->kind)) {
                    // Late deadline or disconnect while draining: outcome stands
                    logs_done = true;
                    break;
                }
                session.state = state_for_error(event->kind);
                throw_execution_error(event->kind, event->message);
        }
    }

    ExecutionResult result;
    result.exit_code = exit_code;
    if (exit_code == 0) {
        session.state = SessionState::SUCCEEDED;
        result.status = ResultStatus::SUCCESS;
    } else {
        session.state = SessionState::FAILED;
        result.status = ResultStatus::ERROR;
    }
    return result;
}

void SessionOrchestrator::cleanup(Session& session) {
    if (session.cleaned_up || session.container_id.empty()) return;
    session.cleaned_up = true;

    try {
        runtime_.remove_container(session.container_id, true);
        log_info("[Session] container " + short_id(session.container_id) + " removed");
    } catch (const std::exception& e) {
        CleanupError error("Failed to remove container " + short_id(session.container_id) +
                           ": " + e.what());
        log_error(std::string("[Session] ") + error_kind_name(error.kind()) + ": " + error.what());
    }
}

SessionOutcome SessionOrchestrator::run(const ExecutionRequest& request, OutputSink& sink,
                                        ExecutionContext& ctx) {
    SessionOutcome outcome;
    Session session;
    auto started = Clock::now();

    try {
        std::vector<uint8_t> archive = run_step<PackagingError>("Failed to package source", [&] {
            return TarArchive::pack_single_file(config_.source_filename, request.source_text);
        });

        ContainerGuard guard(*this, session);
        create_session(session, ctx);

        inject_payload(session, archive, ctx);
        start(session, ctx);
        outcome.result = run_and_collect(session, ctx, sink);
        outcome.state = session.state;
    } catch (const ExecutionError& e) {
        outcome.state = state_for_error(e.kind());
        outcome.error = e.kind();
        outcome.message = e.what();
        outcome.result.status = (outcome.state == SessionState::TIMED_OUT)
            ? ResultStatus::TIMEOUT : ResultStatus::ERROR;
        session.state = outcome.state;
    } catch (const std::exception& e) {
        // Thread or allocation failure inside the orchestrator itself
        outcome.state = SessionState::FAILED;
        outcome.error = ErrorKind::RUNTIME_WAIT;
        outcome.message = std::string("Internal session failure: ") + e.what();
        outcome.result.status = ResultStatus::ERROR;
        session.state = outcome.state;
    }

    outcome.container_id = session.container_id;

    std::ostringstream summary;
    summary << "[Session] " << (outcome.container_id.empty() ? "(no container)" : short_id(outcome.container_id))
            << " " << session_state_name(outcome.state);
    if (outcome.error) {
        summary << " " << error_kind_name(*outcome.error) << ": " << outcome.message;
    } else {
        summary << " exit=" << outcome.result.exit_code;
    }
    summary << " in " << format_duration(Clock::now() - started);

    if (outcome.completed() || outcome.state == SessionState::CANCELLED) {
        log_info(summary.str());
    } else {
        log_error(summary.str());
    }
    return outcome;
}

SessionOutcome SessionOrchestrator::execute(const ExecutionRequest& request, ExecutionContext& ctx) {
    AccumulatingSink sink;
    SessionOutcome outcome = run(request, sink, ctx);
    outcome.result.output = sink.output();
    return outcome;
}

} // namespace coderun
