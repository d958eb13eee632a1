#include "execution_service.h"
#include "joining_thread.h"
#include "logger.h"
#include "utf8_stream.h"

#include <atomic>
#include <mutex>
#include <sstream>
#include <json/json.h>

namespace coderun {

namespace {

std::string to_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace

ExecutionService::ExecutionService(SessionOrchestrator& orchestrator, std::string environment)
    : orchestrator_(orchestrator), environment_(std::move(environment)) {}

void ExecutionService::register_routes(HttpServer& server) {
    server.route("POST", "/v1/execute", [this](const HttpRequest& req) {
        return handle_execute(req);
    });
    server.route("GET", "/v1/healthcheck", [this](const HttpRequest& req) {
        return handle_healthcheck(req);
    });
    server.websocket_route("/v1/execute", [this](int client_fd, const HttpRequest& req) {
        handle_execute_stream(client_fd, req);
    });
}

bool ExecutionService::parse_payload(const std::string& body, ExecutionRequest& request,
                                     std::string& error) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream stream(body);

    if (!Json::parseFromStream(builder, stream, &root, &errs)) {
        error = "Invalid JSON payload";
        return false;
    }
    if (!root.isObject()) {
        error = "Payload must be a JSON object";
        return false;
    }
    if (!root.isMember("text") || !root["text"].isString()) {
        error = "Payload requires a string field 'text'";
        return false;
    }

    request.source_text = root["text"].asString();
    return true;
}

std::string ExecutionService::error_message_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PACKAGING:           return "Failed to package source";
        case ErrorKind::ENVIRONMENT_CREATE:  return "Failed to create container";
        case ErrorKind::INJECTION:           return "Failed to copy files to container";
        case ErrorKind::START:               return "Failed to start container";
        case ErrorKind::RUNTIME_WAIT:        return "Failed to wait for container";
        case ErrorKind::STREAM_DECODE:       return "Failed to decode container output";
        case ErrorKind::DEADLINE_EXCEEDED:   return "Request Timeout";
        case ErrorKind::CLIENT_DISCONNECTED: return "Client disconnected";
        case ErrorKind::CLEANUP:             return "Failed to remove container";
    }
    return "Internal Server Error";
}

int ExecutionService::http_status_for(const SessionOutcome& outcome) {
    if (outcome.completed()) return 200;
    if (outcome.error && *outcome.error == ErrorKind::DEADLINE_EXCEEDED) return 408;
    return 500;
}

HttpResponse ExecutionService::to_http_response(const SessionOutcome& outcome) {
    HttpResponse resp;
    resp.status_code = http_status_for(outcome);

    Json::Value body;
    if (resp.status_code == 200 || resp.status_code == 408) {
        body["status"] = result_status_name(outcome.result.status);
        body["output"] = Utf8Assembler::sanitize(outcome.result.output);
        body["exit_code"] = outcome.result.exit_code;
    } else {
        body["error"] = outcome.error ? error_message_for(*outcome.error)
                                      : std::string("Internal Server Error");
    }

    resp.body = to_json(body);
    return resp;
}

CloseStatus ExecutionService::close_status_for(const SessionOutcome& outcome) {
    CloseStatus status;
    if (outcome.completed()) return status;

    switch (*outcome.error) {
        case ErrorKind::DEADLINE_EXCEEDED:
            status.code = WSCloseCode::POLICY_VIOLATION;
            status.reason = "Request Timeout";
            break;
        case ErrorKind::CLIENT_DISCONNECTED:
            status.send = false;
            break;
        default:
            status.code = WSCloseCode::INTERNAL_ERROR;
            status.reason = "Internal Server Error";
            break;
    }
    return status;
}

HttpResponse ExecutionService::handle_execute(const HttpRequest& req) {
    ExecutionRequest request;
    std::string error;
    if (!parse_payload(req.body, request, error)) {
        return HttpServer::error_response(400, error);
    }

    auto ctx = orchestrator_.new_context();
    SessionOutcome outcome = orchestrator_.execute(request, *ctx);
    return to_http_response(outcome);
}

HttpResponse ExecutionService::handle_healthcheck(const HttpRequest&) const {
    Json::Value body;
    body["status"] = "available";
    body["system_info"]["environment"] = environment_;
    body["system_info"]["version"] = SERVICE_VERSION;

    HttpResponse resp;
    resp.body = to_json(body);
    return resp;
}

bool ExecutionService::read_payload(int client_fd, std::string& payload) {
    auto deadline = std::chrono::steady_clock::now() + orchestrator_.config().timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        if (!WebSocketManager::wait_readable(client_fd, RUNTIME_POLL_INTERVAL_MS)) continue;

        bool is_close = false;
        WSOpcode opcode = WSOpcode::TEXT;
        std::string frame = WebSocketManager::read_frame(client_fd, is_close, &opcode,
                                                         MAX_WEBSOCKET_MESSAGE_SIZE);
        if (is_close) return false;

        if (opcode == WSOpcode::PING) {
            WebSocketManager::send_pong(client_fd, frame);
            continue;
        }
        if (opcode == WSOpcode::TEXT || opcode == WSOpcode::BINARY) {
            payload = frame;
            return true;
        }
    }

    WebSocketManager::send_close(client_fd, WSCloseCode::POLICY_VIOLATION, "Request Timeout");
    return false;
}

void ExecutionService::handle_execute_stream(int client_fd, const HttpRequest& req) {
    log_info("[WebSocket] Client connected: " + req.client_ip);
    HttpServer::set_socket_timeouts(client_fd, WEBSOCKET_IO_TIMEOUT_MS);

    std::string payload;
    if (!read_payload(client_fd, payload)) {
        log_info("[WebSocket] Client left before sending a payload: " + req.client_ip);
        return;
    }

    ExecutionRequest request;
    std::string error;
    if (!parse_payload(payload, request, error)) {
        log_warn("[WebSocket] Bad payload from " + req.client_ip + ": " + error);
        WebSocketManager::send_close(client_fd, WSCloseCode::INVALID_PAYLOAD, "Bad Request");
        return;
    }

    auto ctx = orchestrator_.new_context();
    std::mutex write_mutex;
    std::atomic<bool> finished{false};

    // Text frames must carry whole code points; each stream is reassembled
    // separately since their frames interleave
    Utf8Assembler stdout_text;
    Utf8Assembler stderr_text;

    CallbackSink sink([&](const OutputChunk& chunk) {
        Utf8Assembler& assembler = (chunk.stream == StreamType::STDERR) ? stderr_text : stdout_text;
        std::string text = assembler.feed(chunk.bytes);
        if (text.empty()) return;

        std::lock_guard<std::mutex> lock(write_mutex);
        if (!WebSocketManager::send_text(client_fd, text)) {
            ctx->cancel(CancelReason::CLIENT_DISCONNECTED);
            throw ClientDisconnected();
        }
    });

    SessionOutcome outcome;
    {
        // Watches for a close frame, EOF or an explicit "cancel" message
        JoiningThread reader([&] {
            while (!finished && !ctx->done()) {
                if (!WebSocketManager::wait_readable(client_fd, RUNTIME_POLL_INTERVAL_MS)) continue;
                if (finished) break;

                bool is_close = false;
                WSOpcode opcode = WSOpcode::TEXT;
                std::string frame = WebSocketManager::read_frame(client_fd, is_close, &opcode,
                                                                 MAX_WEBSOCKET_MESSAGE_SIZE);
                if (is_close || (opcode == WSOpcode::TEXT && frame == "cancel")) {
                    ctx->cancel(CancelReason::CLIENT_DISCONNECTED);
                    break;
                }
                if (opcode == WSOpcode::PING) {
                    std::lock_guard<std::mutex> lock(write_mutex);
                    WebSocketManager::send_pong(client_fd, frame);
                }
            }
        });

        outcome = orchestrator_.run(request, sink, *ctx);
        finished = true;
    }

    CloseStatus status = close_status_for(outcome);
    if (status.send) {
        std::lock_guard<std::mutex> lock(write_mutex);
        if (outcome.completed()) {
            // A program that exits mid-character still gets its last bytes
            for (Utf8Assembler* assembler : {&stdout_text, &stderr_text}) {
                std::string tail = assembler->flush();
                if (!tail.empty()) WebSocketManager::send_text(client_fd, tail);
            }
        }
        WebSocketManager::send_close(client_fd, status.code, status.reason);
    }

    log_info("[WebSocket] Stream for " + req.client_ip + " ended: " +
             session_state_name(outcome.state));
}

} // namespace coderun
