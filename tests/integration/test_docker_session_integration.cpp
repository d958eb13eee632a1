/**
 * Session Orchestrator over the Docker client
 *
 * Drives full sessions through DockerClient against a fake daemon on a
 * unix socket, checking what the daemon is asked to do.
 */

#include <gtest/gtest.h>
#include "docker_client.h"
#include "session.h"
#include "support/fake_docker_daemon.h"
#include "support/fake_runtime_client.h"
#include <atomic>
#include <chrono>
#include <json/json.h>
#include <sstream>
#include <thread>

using namespace coderun;
using namespace std::chrono_literals;

// ============================================================================
// Test Fixture
// ============================================================================

class DockerSessionTest : public ::testing::Test {
protected:
    SessionConfig config;

    void SetUp() override {
        config.timeout = 2000ms;
        config.drain_grace = 300ms;
    }

    SessionOutcome run_against(const FakeDockerDaemon& daemon) {
        DockerClientConfig docker;
        docker.socket_path = daemon.socket_path();
        DockerClient client(docker);
        SessionOrchestrator orchestrator(client, config);

        ExecutionRequest request;
        request.source_text = "package main\nfunc main() { println(\"hi\") }\n";
        auto ctx = orchestrator.new_context();
        return orchestrator.execute(request, *ctx);
    }

    static bool ends_with(const std::string& value, const std::string& suffix) {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    static size_t count_method(const std::vector<RecordedRequest>& requests, const std::string& method) {
        size_t n = 0;
        for (const auto& req : requests) {
            if (req.method == method) n++;
        }
        return n;
    }
};

// ============================================================================
// Test Contract: Creation Racing the Deadline
// ============================================================================

TEST_F(DockerSessionTest, ContainerCreatedAfterDeadlineIsRemoved) {
    // Given: A daemon that creates the container only after the deadline
    config.timeout = 150ms;
    FakeDockerDaemon daemon([](const RecordedRequest& req) {
        if (ends_with(req.target, "/containers/create")) {
            std::this_thread::sleep_for(400ms);
            return http_reply(201, "Created", "{\"Id\":\"slow0001\",\"Warnings\":[]}");
        }
        return http_reply(204, "No Content", "");
    });

    // When: Running a session
    SessionOutcome outcome = run_against(daemon);

    // Then: The session timed out
    EXPECT_EQ(outcome.state, SessionState::TIMED_OUT);

    // And: The daemon was told to remove the container it created
    auto requests = daemon.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[1].method, "DELETE");
    EXPECT_EQ(requests[1].target, "/v1.43/containers/slow0001?force=1");
}

// ============================================================================
// Test Contract: Fast-Exiting Programs
// ============================================================================

TEST_F(DockerSessionTest, FastExitKeepsOutputAndExitCode) {
    // Given: A daemon where the program exits the moment it starts, and an
    // auto-removed container vanishes along with its logs and exit status
    std::atomic<bool> auto_remove{true};
    std::atomic<bool> exited{false};
    FakeDockerDaemon daemon([&](const RecordedRequest& req) {
        const std::string& t = req.target;
        bool gone = exited && auto_remove;
        if (req.method == "POST" && ends_with(t, "/containers/create")) {
            Json::CharReaderBuilder builder;
            Json::Value body;
            std::string errs;
            std::istringstream stream(req.body);
            if (Json::parseFromStream(builder, stream, &body, &errs)) {
                auto_remove = body["HostConfig"]["AutoRemove"].asBool();
            }
            return http_reply(201, "Created", "{\"Id\":\"fast0001\",\"Warnings\":[]}");
        }
        if (req.method == "PUT") return http_reply(200, "OK", "");
        if (ends_with(t, "/start")) {
            exited = true;
            return http_reply(204, "No Content", "");
        }
        if (gone) {
            return http_reply(404, "Not Found", "{\"message\":\"No such container: fast0001\"}");
        }
        if (t.find("/logs?") != std::string::npos) {
            return http_reply(200, "OK", stdout_frame("hi\n"));
        }
        if (t.find("/wait?") != std::string::npos) {
            return http_reply(200, "OK", "{\"StatusCode\":3}");
        }
        return http_reply(204, "No Content", "");
    });

    // When: Running a session
    SessionOutcome outcome = run_against(daemon);

    // Then: The container was not auto-removed, so output and exit code survive
    EXPECT_FALSE(auto_remove);
    EXPECT_TRUE(outcome.completed()) << outcome.message;
    EXPECT_EQ(outcome.state, SessionState::FAILED);
    EXPECT_EQ(outcome.result.exit_code, 3);
    EXPECT_EQ(outcome.result.output, "hi\n");

    // And: Removal was explicit
    EXPECT_EQ(count_method(daemon.requests(), "DELETE"), 1u);
}
