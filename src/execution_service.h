#pragma once

#include <string>
#include "http_server.h"
#include "session.h"
#include "websocket.h"

namespace coderun {

// How a streaming session ends on the wire. send is false when the peer is
// already gone and no close frame should be written.
struct CloseStatus {
    bool send = true;
    WSCloseCode code = WSCloseCode::NORMAL;
    std::string reason;
};

// Transport adapter: turns /v1/execute requests (plain HTTP or a WebSocket
// stream) into orchestrator runs and maps outcomes back onto the transport.
class ExecutionService {
public:
    ExecutionService(SessionOrchestrator& orchestrator, std::string environment);

    // POST /v1/execute
    HttpResponse handle_execute(const HttpRequest& req);

    // GET /v1/execute after the WebSocket handshake
    void handle_execute_stream(int client_fd, const HttpRequest& req);

    // GET /v1/healthcheck
    HttpResponse handle_healthcheck(const HttpRequest& req) const;

    void register_routes(HttpServer& server);

    // Reads {"text": "..."}; on failure error describes the problem
    static bool parse_payload(const std::string& body, ExecutionRequest& request,
                              std::string& error);

    static int http_status_for(const SessionOutcome& outcome);
    static HttpResponse to_http_response(const SessionOutcome& outcome);
    static CloseStatus close_status_for(const SessionOutcome& outcome);
    static std::string error_message_for(ErrorKind kind);

private:
    // Waits for the first data frame; false if the client left or stayed silent
    bool read_payload(int client_fd, std::string& payload);

    SessionOrchestrator& orchestrator_;
    std::string environment_;
};

} // namespace coderun
