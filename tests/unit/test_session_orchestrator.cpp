#include <gtest/gtest.h>
#include "session.h"
#include "tar_archive.h"
#include "support/fake_runtime_client.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

using namespace coderun;
using namespace std::chrono_literals;

// ============================================================================
// Test Fixture
// ============================================================================

class SessionOrchestratorTest : public ::testing::Test {
protected:
    FakeRuntimeClient runtime;
    SessionConfig config;

    void SetUp() override {
        config.timeout = 2000ms;
        config.drain_grace = 500ms;
    }

    SessionOrchestrator make_orchestrator() {
        return SessionOrchestrator(runtime, config);
    }

    ExecutionRequest request(const std::string& text = "package main\nfunc main() { println(1) }\n") {
        ExecutionRequest req;
        req.source_text = text;
        return req;
    }
};

// ============================================================================
// Completed Runs
// ============================================================================

TEST_F(SessionOrchestratorTest, SuccessfulRunReturnsOutput) {
    // Given: A program that prints 1 and exits 0
    runtime.output = {stdout_frame("1\n")};
    runtime.exit_code = 0;
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing synchronously
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: success with the printed output
    EXPECT_TRUE(outcome.completed());
    EXPECT_EQ(outcome.state, SessionState::SUCCEEDED);
    EXPECT_EQ(outcome.result.status, ResultStatus::SUCCESS);
    EXPECT_EQ(outcome.result.output, "1\n");
    EXPECT_EQ(outcome.result.exit_code, 0);
    EXPECT_FALSE(outcome.error.has_value());

    // And: The container was removed exactly once, forcibly
    EXPECT_EQ(runtime.remove_calls, 1);
    EXPECT_TRUE(runtime.last_remove_forced);
}

TEST_F(SessionOrchestratorTest, NonZeroExitIsFailedWithOutput) {
    // Given: A program that writes to stderr and exits 2
    runtime.output = {stdout_frame("partial\n"), stderr_frame("panic: boom\n")};
    runtime.exit_code = 2;
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: Completed but failed, combined output kept
    EXPECT_TRUE(outcome.completed());
    EXPECT_EQ(outcome.state, SessionState::FAILED);
    EXPECT_EQ(outcome.result.status, ResultStatus::ERROR);
    EXPECT_EQ(outcome.result.exit_code, 2);
    EXPECT_EQ(outcome.result.output, "partial\npanic: boom\n");
    EXPECT_EQ(runtime.remove_calls, 1);
}

TEST_F(SessionOrchestratorTest, InjectsSourceAsSingleFileArchive) {
    // Given: Some source text
    std::string source = "package main\n";
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    orchestrator.execute(request(source), *ctx);

    // Then: The archive copied into the working directory holds main.go
    EXPECT_EQ(runtime.last_copy_path(), "/app");
    TarEntry entry = TarArchive::read_single_entry(runtime.last_archive());
    EXPECT_EQ(entry.name, "main.go");
    EXPECT_EQ(entry.contents, source);
    EXPECT_EQ(entry.mode, 0644u);
}

TEST_F(SessionOrchestratorTest, CreatesContainerFromConfiguredEnvironment) {
    // Given: A non-default image and a TTY
    config.image = "golang:1.22-alpine";
    config.tty = true;
    runtime.output = {"raw tty output\n"};
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: The spec carries the environment
    ContainerSpec spec = runtime.last_spec();
    EXPECT_EQ(spec.image, "golang:1.22-alpine");
    EXPECT_EQ(spec.command, (std::vector<std::string>{"go", "run", "main.go"}));
    EXPECT_EQ(spec.working_dir, "/app");
    EXPECT_TRUE(spec.tty);

    // And: Raw framing passed the bytes through
    EXPECT_EQ(outcome.result.output, "raw tty output\n");
}

TEST_F(SessionOrchestratorTest, EmptySourceStillRuns) {
    // Given: Empty source text
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(""), *ctx);

    // Then: A zero-length file was injected and the run completed
    EXPECT_TRUE(outcome.completed());
    EXPECT_TRUE(TarArchive::read_single_entry(runtime.last_archive()).contents.empty());
}

TEST_F(SessionOrchestratorTest, StreamingSinkSeesChunksInOrder) {
    // Given: Three stdout chunks
    runtime.output = {stdout_frame("a"), stdout_frame("b"), stdout_frame("c")};
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    std::mutex mutex;
    std::vector<OutputChunk> seen;
    CallbackSink sink([&](const OutputChunk& chunk) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(chunk);
    });

    // When: Running with a streaming sink
    SessionOutcome outcome = orchestrator.run(request(), sink, *ctx);

    // Then: Sequences 0, 1, 2 in runtime order
    EXPECT_TRUE(outcome.completed());
    ASSERT_EQ(seen.size(), 3u);
    for (size_t i = 0; i < seen.size(); ++i) {
        EXPECT_EQ(seen[i].sequence, i);
    }
    EXPECT_EQ(seen[2].bytes, "c");
}

// ============================================================================
// Step Failures
// ============================================================================

TEST_F(SessionOrchestratorTest, CreateFailureSkipsCleanup) {
    // Given: The image cannot be found
    runtime.fail_create = true;
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: EnvironmentCreateError, and nothing to remove
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorKind::ENVIRONMENT_CREATE);
    EXPECT_EQ(outcome.state, SessionState::FAILED);
    EXPECT_EQ(runtime.copy_calls, 0);
    EXPECT_EQ(runtime.remove_calls, 0);
}

TEST_F(SessionOrchestratorTest, InjectionFailureRemovesContainerOnce) {
    // Given: Copying the archive fails
    runtime.fail_copy = true;
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: InjectionError, start never called, exactly one removal
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorKind::INJECTION);
    EXPECT_EQ(runtime.start_calls, 0);
    EXPECT_EQ(runtime.remove_calls, 1);
    EXPECT_NE(outcome.message.find("Failed to copy files to container"), std::string::npos);
}

TEST_F(SessionOrchestratorTest, StartFailureRemovesContainerOnce) {
    // Given: Starting the container fails
    runtime.fail_start = true;
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: StartError with one forced removal
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorKind::START);
    EXPECT_EQ(runtime.remove_calls, 1);
    EXPECT_TRUE(runtime.last_remove_forced);
}

TEST_F(SessionOrchestratorTest, WaitFailureIsRuntimeWaitError) {
    // Given: The wait call fails
    runtime.fail_wait = true;
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: RuntimeWaitError and cleanup
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorKind::RUNTIME_WAIT);
    EXPECT_EQ(runtime.remove_calls, 1);
}

TEST_F(SessionOrchestratorTest, MalformedOutputIsStreamDecodeError) {
    // Given: The runtime emits a frame with an unknown stream type
    runtime.output = {mux_frame(5, "garbage")};
    runtime.hang = true;
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: StreamDecodeError decided the race, not the deadline
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorKind::STREAM_DECODE);
    EXPECT_EQ(runtime.remove_calls, 1);
}

TEST_F(SessionOrchestratorTest, PackagingFailureCreatesNothing) {
    // Given: A file name that does not fit a tar header
    config.source_filename = std::string(120, 'f');
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: PackagingError before any runtime call
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorKind::PACKAGING);
    EXPECT_EQ(runtime.create_calls, 0);
    EXPECT_EQ(runtime.remove_calls, 0);
}

// ============================================================================
// Deadline and Cancellation
// ============================================================================

TEST_F(SessionOrchestratorTest, DeadlineExpiryTimesOut) {
    // Given: A program that never exits, and a short deadline
    config.timeout = 200ms;
    runtime.hang = true;
    runtime.output = {stdout_frame("started\n")};
    runtime.late_output = stdout_frame("after the deadline\n");
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();
    auto started = std::chrono::steady_clock::now();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: TimedOut with the partial output only
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorKind::DEADLINE_EXCEEDED);
    EXPECT_EQ(outcome.state, SessionState::TIMED_OUT);
    EXPECT_EQ(outcome.result.status, ResultStatus::TIMEOUT);
    EXPECT_EQ(outcome.result.output, "started\n");

    // And: Forced removal, promptly
    EXPECT_EQ(runtime.remove_calls, 1);
    EXPECT_TRUE(runtime.last_remove_forced);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
}

TEST_F(SessionOrchestratorTest, CreateAnsweredAfterDeadlineIsStillRemoved) {
    // Given: A runtime whose create reply arrives after the deadline
    config.timeout = 100ms;
    runtime.create_delay = 300ms;
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: Timed out without touching the container further
    EXPECT_EQ(outcome.state, SessionState::TIMED_OUT);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorKind::DEADLINE_EXCEEDED);
    EXPECT_EQ(runtime.copy_calls, 0);
    EXPECT_EQ(runtime.start_calls, 0);

    // And: The container it created was removed
    EXPECT_EQ(outcome.container_id, runtime.container_id);
    EXPECT_EQ(runtime.remove_calls, 1);
    EXPECT_TRUE(runtime.last_remove_forced);
}

TEST_F(SessionOrchestratorTest, ClientCancelMarksSessionCancelled) {
    // Given: A long-running program
    config.timeout = 5000ms;
    runtime.hang = true;
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: The client goes away mid-run
    std::thread client([&ctx] {
        std::this_thread::sleep_for(100ms);
        ctx->cancel(CancelReason::CLIENT_DISCONNECTED);
    });
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);
    client.join();

    // Then: Cancelled with forced cleanup, well before the deadline
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorKind::CLIENT_DISCONNECTED);
    EXPECT_EQ(outcome.state, SessionState::CANCELLED);
    EXPECT_EQ(runtime.remove_calls, 1);
    EXPECT_TRUE(runtime.last_remove_forced);
}

TEST_F(SessionOrchestratorTest, FailedClientWriteCancelsSession) {
    // Given: A sink whose consumer vanished
    config.timeout = 5000ms;
    runtime.hang = true;
    runtime.output = {stdout_frame("hello\n")};
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();
    CallbackSink sink([](const OutputChunk&) { throw ClientDisconnected("write failed"); });

    // When: Running
    SessionOutcome outcome = orchestrator.run(request(), sink, *ctx);

    // Then: The write failure is a cancellation
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorKind::CLIENT_DISCONNECTED);
    EXPECT_EQ(outcome.state, SessionState::CANCELLED);
    EXPECT_EQ(runtime.remove_calls, 1);
}

TEST_F(SessionOrchestratorTest, NoChunkForwardedAfterDeadline) {
    // Given: A stream that produces output only after the deadline
    config.timeout = 150ms;
    runtime.hang = true;
    runtime.late_output = stdout_frame("too late\n");
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    std::atomic<int> chunks{0};
    CallbackSink sink([&chunks](const OutputChunk&) { chunks++; });

    // When: Running
    SessionOutcome outcome = orchestrator.run(request(), sink, *ctx);

    // Then: The late chunk never reached the sink
    EXPECT_EQ(outcome.state, SessionState::TIMED_OUT);
    EXPECT_EQ(chunks, 0);
}

TEST_F(SessionOrchestratorTest, CancelBeforeStartSkipsRuntimeWork) {
    // Given: A context cancelled before the run
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();
    ctx->cancel(CancelReason::CLIENT_DISCONNECTED);

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: Cancelled without creating anything
    EXPECT_EQ(outcome.state, SessionState::CANCELLED);
    EXPECT_EQ(runtime.create_calls, 0);
    EXPECT_EQ(runtime.remove_calls, 0);
}

// ============================================================================
// Cleanup
// ============================================================================

TEST_F(SessionOrchestratorTest, CleanupFailureDoesNotOverwriteOutcome) {
    // Given: A successful run whose removal fails
    runtime.output = {stdout_frame("1\n")};
    runtime.fail_remove = true;
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();

    // When: Executing
    SessionOutcome outcome = orchestrator.execute(request(), *ctx);

    // Then: Still a success
    EXPECT_TRUE(outcome.completed());
    EXPECT_EQ(outcome.state, SessionState::SUCCEEDED);
    EXPECT_EQ(outcome.result.output, "1\n");
    EXPECT_EQ(runtime.remove_calls, 1);
}

TEST_F(SessionOrchestratorTest, CleanupIsIdempotent) {
    // Given: A created session
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();
    Session session;
    orchestrator.create_session(session, *ctx);

    // When: Cleaning up twice
    orchestrator.cleanup(session);
    orchestrator.cleanup(session);

    // Then: One removal request
    EXPECT_TRUE(session.cleaned_up);
    EXPECT_EQ(runtime.remove_calls, 1);
}

TEST_F(SessionOrchestratorTest, GuardRemovesContainerWhenStepThrows) {
    // Given: A created session and a failing start
    runtime.fail_start = true;
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();
    Session session;
    orchestrator.create_session(session, *ctx);

    // When: The step throws inside the guard's scope
    try {
        ContainerGuard guard(orchestrator, session);
        orchestrator.start(session, *ctx);
        FAIL() << "Expected StartError";
    } catch (const StartError&) {
    }

    // Then: The container was still removed
    EXPECT_EQ(runtime.remove_calls, 1);
    EXPECT_TRUE(session.cleaned_up);
}

TEST_F(SessionOrchestratorTest, StateProgressesThroughLifecycle) {
    // Given: A fresh session
    auto orchestrator = make_orchestrator();
    auto ctx = orchestrator.new_context();
    Session session;
    orchestrator.create_session(session, *ctx);
    ContainerGuard guard(orchestrator, session);
    EXPECT_EQ(session.state, SessionState::CREATED);

    // When/Then: Each step advances the state
    orchestrator.inject_payload(session, TarArchive::pack_single_file("main.go", ""), *ctx);
    EXPECT_EQ(session.state, SessionState::INJECTED);

    orchestrator.start(session, *ctx);
    EXPECT_EQ(session.state, SessionState::RUNNING);

    AccumulatingSink sink;
    ExecutionResult result = orchestrator.run_and_collect(session, *ctx, sink);
    EXPECT_EQ(session.state, SessionState::SUCCEEDED);
    EXPECT_EQ(result.status, ResultStatus::SUCCESS);
    EXPECT_TRUE(is_terminal(session.state));
}
