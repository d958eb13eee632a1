#pragma once

#include <string>
#include <functional>
#include <map>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include "constants.h"

namespace coderun {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Header lookup ignoring case; empty if absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Takes over the connection once the WebSocket handshake has been sent.
// The server closes the descriptor when the handler returns.
using WebSocketHandler = std::function<void(int client_fd, const HttpRequest&)>;

// Minimal HTTP server - no external dependencies
class HttpServer {
public:
    // io_timeout_ms bounds every read and write on an accepted connection
    explicit HttpServer(int port = DEFAULT_PORT, int io_timeout_ms = HTTP_IO_TIMEOUT_MS);
    ~HttpServer();

    // Register route handlers. A path ending in '/' also matches every
    // path below it.
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Register a WebSocket endpoint (GET with Upgrade: websocket)
    void websocket_route(const std::string& path, WebSocketHandler handler);

    // Start server (blocks)
    void start();

    // Stop accepting and wait for in-flight connections to finish
    void stop();

    bool is_running() const { return running_; }
    int port() const { return port_; }

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static const char* status_text(int status_code);
    static HttpResponse error_response(int status_code, const std::string& message);

    // SO_RCVTIMEO and SO_SNDTIMEO on a connected socket
    static void set_socket_timeouts(int fd, int timeout_ms);

private:
    int port_;
    int io_timeout_ms_;
    int server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;
    std::map<std::string, WebSocketHandler> websocket_routes_;

    std::mutex clients_mutex_;
    std::condition_variable clients_cv_;
    int active_clients_ = 0;

    void handle_client(int client_fd, const std::string& client_ip);
    bool read_request(int client_fd, std::string& request_data, HttpResponse& error);
    HttpResponse dispatch(const HttpRequest& req);
    const WebSocketHandler* find_websocket_route(const std::string& path) const;
    void log_request(const HttpRequest& req, int status_code,
                     std::chrono::steady_clock::duration elapsed) const;
};

} // namespace coderun
