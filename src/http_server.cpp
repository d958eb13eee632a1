#include "http_server.h"
#include "logger.h"
#include "websocket.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <json/json.h>

namespace coderun {

namespace {

std::string to_lower(std::string value) {
    for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r");
    return value.substr(start, end - start + 1);
}

std::string strip_query(const std::string& path) {
    return path.substr(0, path.find('?'));
}

void write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;  // Client went away
        sent += static_cast<size_t>(n);
    }
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) return value;
    }
    return "";
}

HttpServer::HttpServer(int port, int io_timeout_ms)
    : port_(port), io_timeout_ms_(io_timeout_ms), server_fd_(-1), running_(false) {}

void HttpServer::set_socket_timeouts(int fd, int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

void HttpServer::websocket_route(const std::string& path, WebSocketHandler handler) {
    websocket_routes_[path] = handler;
}

void HttpServer::start() {
    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    // Listen
    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to listen");
    }

    running_ = true;
    log_info("Server listening on port " + std::to_string(port_));

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_) continue;
            break;
        }

        // Get client IP
        char ip_buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_buf, sizeof(ip_buf));
        std::string client_ip = std::string(ip_buf) + ":" + std::to_string(ntohs(client_addr.sin_port));

        // A silent client must not hold its thread, or stop(), forever
        set_socket_timeouts(client_fd, io_timeout_ms_);

        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            active_clients_++;
        }

        // Handle in new thread (simple concurrency)
        std::thread([this, client_fd, client_ip]() {
            try {
                handle_client(client_fd, client_ip);
            } catch (const std::exception& e) {
                log_error(std::string("Connection from ") + client_ip + " failed: " + e.what());
            }
            close(client_fd);

            std::lock_guard<std::mutex> lock(clients_mutex_);
            active_clients_--;
            clients_cv_.notify_all();
        }).detach();
    }
}

void HttpServer::stop() {
    running_ = false;
    if (server_fd_ >= 0) {
        // shutdown() wakes a thread blocked in accept()
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }

    std::unique_lock<std::mutex> lock(clients_mutex_);
    clients_cv_.wait(lock, [this] { return active_clients_ == 0; });
}

bool HttpServer::read_request(int client_fd, std::string& request_data, HttpResponse& error) {
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;

    // Read request in chunks with size limit
    while ((bytes_read = read(client_fd, buffer, sizeof(buffer))) > 0) {
        if (request_data.size() + bytes_read > MAX_REQUEST_SIZE) {
            error = error_response(413, "Request exceeds size limit");
            return false;
        }
        request_data.append(buffer, bytes_read);

        // Check if we've received the complete headers
        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) continue;

        HttpRequest head = parse_request(request_data.substr(0, header_end + 4));
        std::string length_str = head.header("Content-Length");
        if (length_str.empty()) {
            // No Content-Length, assume request is complete
            return true;
        }

        size_t content_length = 0;
        try {
            content_length = std::stoul(length_str);
        } catch (const std::exception&) {
            error = error_response(400, "Invalid Content-Length");
            return false;
        }

        // Calculate expected total size
        size_t expected_size = header_end + 4 + content_length;
        if (expected_size > MAX_REQUEST_SIZE) {
            error = error_response(413, "Request exceeds size limit");
            return false;
        }

        // Read remaining body if needed
        while (request_data.size() < expected_size) {
            bytes_read = read(client_fd, buffer,
                std::min(sizeof(buffer), expected_size - request_data.size()));
            if (bytes_read < 0 && errno == EINTR) continue;
            if (bytes_read <= 0) break;
            request_data.append(buffer, bytes_read);
        }
        if (request_data.size() < expected_size) {
            if (bytes_read < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                error = error_response(408, "Request Timeout");
            } else {
                error = error_response(400, "Request body shorter than Content-Length");
            }
            return false;
        }
        return true;
    }

    if (bytes_read < 0 && (errno == EAGAIN || errno == EWOULDBLOCK) && !request_data.empty()) {
        error = error_response(408, "Request Timeout");
        return false;
    }
    return !request_data.empty();
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    auto started = std::chrono::steady_clock::now();

    std::string request_data;
    HttpResponse error;
    error.status_code = 0;
    if (!read_request(client_fd, request_data, error)) {
        if (error.status_code != 0) {
            write_all(client_fd, build_response(error));
        }
        return;
    }

    // Parse request
    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    // WebSocket upgrade
    if (WebSocketManager::is_websocket_upgrade(req.headers)) {
        const WebSocketHandler* handler = find_websocket_route(req.path);
        std::string sec_key = req.header("Sec-WebSocket-Key");

        if (!handler || req.method != "GET") {
            HttpResponse resp = error_response(404, "Not found");
            write_all(client_fd, build_response(resp));
            log_request(req, resp.status_code, std::chrono::steady_clock::now() - started);
            return;
        }
        if (sec_key.empty()) {
            HttpResponse resp = error_response(400, "Missing Sec-WebSocket-Key");
            write_all(client_fd, build_response(resp));
            log_request(req, resp.status_code, std::chrono::steady_clock::now() - started);
            return;
        }

        write_all(client_fd, WebSocketManager::create_handshake_response(sec_key));
        (*handler)(client_fd, req);
        log_request(req, 101, std::chrono::steady_clock::now() - started);
        return;
    }

    // Send response
    HttpResponse resp = dispatch(req);
    write_all(client_fd, build_response(resp));
    log_request(req, resp.status_code, std::chrono::steady_clock::now() - started);
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) {
    std::string path = strip_query(req.path);

    // Check for exact match
    auto it = routes_.find(req.method + " " + path);
    if (it == routes_.end()) {
        // Check for prefix matches ("/status/" style routes)
        for (auto candidate = routes_.begin(); candidate != routes_.end(); ++candidate) {
            const std::string& pattern = candidate->first;
            size_t space_pos = pattern.find(' ');
            std::string method = pattern.substr(0, space_pos);
            std::string path_pattern = pattern.substr(space_pos + 1);

            if (method == req.method && path_pattern.size() > 1 && path_pattern.back() == '/' &&
                path.compare(0, path_pattern.size(), path_pattern) == 0) {
                it = candidate;
                break;
            }
        }
    }

    if (it == routes_.end()) {
        if (find_websocket_route(path) && req.method == "GET") {
            HttpResponse resp = error_response(426, "WebSocket upgrade required");
            resp.headers["Upgrade"] = "websocket";
            return resp;
        }
        return error_response(404, "Not found");
    }

    try {
        return it->second(req);
    } catch (const std::exception& e) {
        log_error("Handler for " + req.method + " " + path + " failed: " + e.what());
        return error_response(500, e.what());
    }
}

const WebSocketHandler* HttpServer::find_websocket_route(const std::string& path) const {
    std::string bare = strip_query(path);
    auto it = websocket_routes_.find(bare);
    if (it != websocket_routes_.end()) return &it->second;

    for (const auto& [pattern, handler] : websocket_routes_) {
        if (pattern.size() > 1 && pattern.back() == '/' &&
            bare.compare(0, pattern.size(), pattern) == 0) {
            return &handler;
        }
    }
    return nullptr;
}

void HttpServer::log_request(const HttpRequest& req, int status_code,
                             std::chrono::steady_clock::duration elapsed) const {
    std::ostringstream line;
    line << req.client_ip << " " << req.method << " " << req.path << " "
         << status_code << " " << format_duration(elapsed);

    if (status_code >= 400) {
        log_error(line.str());
    } else {
        log_info(line.str());
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = (header_end == std::string::npos) ? raw : raw.substr(0, header_end);
    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        req.path = line.substr(space1 + 1, space2 - space1 - 1);
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = trim(line.substr(0, colon));
            req.headers[key] = trim(line.substr(colon + 1));
        }
    }

    // Rest is body
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    return req;
}

const char* HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 426: return "Upgrade Required";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

HttpResponse HttpServer::error_response(int status_code, const std::string& message) {
    Json::Value body;
    body["error"] = message;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    HttpResponse resp;
    resp.status_code = status_code;
    resp.body = Json::writeString(builder, body);
    return resp;
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    // Content length
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

} // namespace coderun
