#include "docker_client.h"
#include "errors.h"
#include "logger.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <iomanip>
#include <sstream>
#include <json/json.h>

namespace coderun {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t MAX_RESPONSE_HEAD = 64 * 1024;

// Closes the descriptor on scope exit
class SocketFd {
public:
    explicit SocketFd(int fd) : fd_(fd) {}
    ~SocketFd() {
        if (fd_ >= 0) close(fd_);
    }
    SocketFd(const SocketFd&) = delete;
    SocketFd& operator=(const SocketFd&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

using CheckFn = std::function<void()>;

void send_all(int fd, const char* data, size_t len, const CheckFn& check) {
    size_t sent = 0;
    while (sent < len) {
        check();
        pollfd pfd{fd, POLLOUT, 0};
        int ready = poll(&pfd, 1, RUNTIME_POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw RuntimeError(std::string("poll failed: ") + strerror(errno));
        }
        if (ready == 0) continue;

        ssize_t n = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw RuntimeError(std::string("write to container runtime failed: ") + strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

// Returns 0 on orderly close
size_t recv_some(int fd, char* buffer, size_t len, const CheckFn& check) {
    while (true) {
        check();
        pollfd pfd{fd, POLLIN, 0};
        int ready = poll(&pfd, 1, RUNTIME_POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw RuntimeError(std::string("poll failed: ") + strerror(errno));
        }
        if (ready == 0) continue;

        ssize_t n = recv(fd, buffer, len, 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw RuntimeError(std::string("read from container runtime failed: ") + strerror(errno));
        }
        return static_cast<size_t>(n);
    }
}

bool parse_json(const std::string& text, Json::Value& out, std::string& errors) {
    Json::CharReaderBuilder builder;
    std::istringstream stream(text);
    return Json::parseFromStream(builder, stream, &out, &errors);
}

std::string to_lower(std::string value) {
    for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string containers_path(const std::string& container_id, const std::string& suffix = "") {
    return "/containers/" + DockerClient::url_encode(container_id) + suffix;
}

} // namespace

// ChunkedDecoder

bool ChunkedDecoder::feed(const char* data, size_t len, std::string& out) {
    size_t pos = 0;
    while (pos < len && state_ != State::DONE) {
        switch (state_) {
            case State::SIZE:
            case State::DATA_END:
            case State::TRAILER: {
                char c = data[pos++];
                if (c != '\n') {
                    line_ += c;
                    if (line_.size() > 1024) {
                        throw RuntimeError("chunk header too long");
                    }
                    break;
                }
                if (!line_.empty() && line_.back() == '\r') line_.pop_back();

                if (state_ == State::DATA_END) {
                    if (!line_.empty()) throw RuntimeError("missing CRLF after chunk data");
                    state_ = State::SIZE;
                } else if (state_ == State::TRAILER) {
                    // Trailer headers end with an empty line
                    if (line_.empty()) state_ = State::DONE;
                } else {
                    std::string size_text = line_.substr(0, line_.find(';'));
                    size_text = trim(size_text);
                    if (size_text.empty() ||
                        !std::all_of(size_text.begin(), size_text.end(),
                                     [](char h) { return std::isxdigit(static_cast<unsigned char>(h)); })) {
                        throw RuntimeError("invalid chunk size '" + size_text + "'");
                    }
                    if (size_text.size() > 15) {
                        throw RuntimeError("chunk size out of range");
                    }
                    remaining_ = std::stoul(size_text, nullptr, 16);
                    state_ = (remaining_ == 0) ? State::TRAILER : State::DATA;
                }
                line_.clear();
                break;
            }
            case State::DATA: {
                size_t take = std::min(remaining_, len - pos);
                out.append(data + pos, take);
                pos += take;
                remaining_ -= take;
                if (remaining_ == 0) state_ = State::DATA_END;
                break;
            }
            case State::DONE:
                break;
        }
    }
    return state_ == State::DONE;
}

// DockerClient

DockerClient::DockerClient(DockerClientConfig config) : config_(std::move(config)) {}

std::string DockerClient::api_path(const std::string& path) const {
    if (config_.api_version.empty()) return path;
    return "/v" + config_.api_version + path;
}

std::string DockerClient::url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string DockerClient::build_create_body(const ContainerSpec& spec) {
    Json::Value body;
    body["Image"] = spec.image;

    Json::Value cmd(Json::arrayValue);
    for (const auto& arg : spec.command) {
        cmd.append(arg);
    }
    body["Cmd"] = cmd;
    body["WorkingDir"] = spec.working_dir;
    body["Tty"] = spec.tty;
    body["AttachStdin"] = false;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;
    body["OpenStdin"] = false;

    // Removal is always explicit; daemon-side auto-removal could delete an
    // exited container before its logs and exit code are read
    Json::Value host_config;
    host_config["AutoRemove"] = false;
    body["HostConfig"] = host_config;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, body);
}

bool DockerClient::parse_response_head(const std::string& raw, DockerResponse& response,
                                       size_t& body_offset) {
    size_t head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) return false;

    std::istringstream stream(raw.substr(0, head_end));
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    // HTTP/1.1 201 Created
    size_t space1 = line.find(' ');
    if (line.compare(0, 5, "HTTP/") != 0 || space1 == std::string::npos) {
        throw RuntimeError("malformed response from container runtime: " + line);
    }
    std::string code = line.substr(space1 + 1, 3);
    if (code.size() != 3 || !std::all_of(code.begin(), code.end(),
                                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        throw RuntimeError("malformed status line from container runtime: " + line);
    }
    response.status_code = std::stoi(code);

    response.headers.clear();
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        response.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    body_offset = head_end + 4;
    return true;
}

std::string DockerClient::error_message(const DockerResponse& response) {
    Json::Value json;
    std::string errors;
    if (!response.body.empty() && parse_json(response.body, json, errors) &&
        json.isObject() && json["message"].isString()) {
        return json["message"].asString();
    }

    std::string text = trim(response.body);
    if (!text.empty()) return text;
    return "container runtime returned HTTP " + std::to_string(response.status_code);
}

int DockerClient::connect_socket() const {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (config_.socket_path.size() >= sizeof(addr.sun_path)) {
        throw RuntimeError("docker socket path too long: " + config_.socket_path);
    }
    std::memcpy(addr.sun_path, config_.socket_path.c_str(), config_.socket_path.size() + 1);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw RuntimeError(std::string("failed to create socket: ") + strerror(errno));
    }
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int saved = errno;
        close(fd);
        throw RuntimeError("cannot connect to container runtime at " + config_.socket_path +
                           ": " + strerror(saved));
    }
    return fd;
}

DockerResponse DockerClient::perform(const std::string& method,
                                     const std::string& path,
                                     const std::string& content_type,
                                     const char* body,
                                     size_t body_len,
                                     const ExecutionContext* ctx,
                                     const ByteHandler* on_body,
                                     bool finish_once_sent) const {
    auto hard_deadline = Clock::now() + std::chrono::seconds(CLEANUP_TIMEOUT_SECONDS);
    const ExecutionContext* bound = ctx;
    CheckFn check = [&]() {
        if (bound) {
            bound->throw_if_done();
        } else if (Clock::now() >= hard_deadline) {
            throw RuntimeError(method + " " + path + " timed out");
        }
    };

    check();
    SocketFd sock(connect_socket());

    std::ostringstream head;
    head << method << " " << api_path(path) << " HTTP/1.1\r\n"
         << "Host: docker\r\n"
         << "User-Agent: coderun/" << SERVICE_VERSION << "\r\n"
         << "Connection: close\r\n";
    if (!content_type.empty()) {
        head << "Content-Type: " << content_type << "\r\n";
    }
    head << "Content-Length: " << body_len << "\r\n\r\n";

    std::string head_str = head.str();
    send_all(sock.get(), head_str.data(), head_str.size(), check);
    if (body_len > 0) {
        send_all(sock.get(), body, body_len, check);
    }
    if (finish_once_sent) {
        bound = nullptr;
        hard_deadline = Clock::now() + std::chrono::seconds(CLEANUP_TIMEOUT_SECONDS);
    }

    // Status line and headers
    DockerResponse response;
    std::string raw;
    size_t body_offset = 0;
    char buffer[PIPE_BUFFER_SIZE];
    while (!parse_response_head(raw, response, body_offset)) {
        size_t n = recv_some(sock.get(), buffer, sizeof(buffer), check);
        if (n == 0) {
            throw RuntimeError("container runtime closed the connection before replying to " +
                               method + " " + path);
        }
        raw.append(buffer, n);
        if (raw.size() > MAX_RESPONSE_HEAD) {
            throw RuntimeError("response headers from container runtime too large");
        }
    }

    bool stream_body = on_body && response.status_code >= 200 && response.status_code < 300;
    auto deliver = [&](const char* data, size_t len) {
        if (len == 0) return;
        if (stream_body) {
            (*on_body)(data, len);
            return;
        }
        if (response.body.size() + len > MAX_RUNTIME_RESPONSE_SIZE) {
            throw RuntimeError("response from container runtime too large");
        }
        response.body.append(data, len);
    };

    auto te = response.headers.find("transfer-encoding");
    bool chunked = te != response.headers.end() && to_lower(te->second).find("chunked") != std::string::npos;

    bool has_length = false;
    size_t remaining = 0;
    auto cl = response.headers.find("content-length");
    if (!chunked && cl != response.headers.end()) {
        try {
            remaining = std::stoul(cl->second);
            has_length = true;
        } catch (const std::exception&) {
            throw RuntimeError("invalid Content-Length from container runtime: " + cl->second);
        }
    }

    ChunkedDecoder decoder;
    std::string decoded;
    // Returns true when the body is complete
    auto consume = [&](const char* data, size_t len) -> bool {
        if (chunked) {
            decoded.clear();
            bool done = decoder.feed(data, len, decoded);
            deliver(decoded.data(), decoded.size());
            return done;
        }
        if (has_length) {
            size_t take = std::min(len, remaining);
            deliver(data, take);
            remaining -= take;
            return remaining == 0;
        }
        deliver(data, len);
        return false;
    };

    bool done = response.status_code == 204 || response.status_code == 304 ||
                (has_length && remaining == 0);
    if (!done && raw.size() > body_offset) {
        done = consume(raw.data() + body_offset, raw.size() - body_offset);
    }
    while (!done) {
        size_t n = recv_some(sock.get(), buffer, sizeof(buffer), check);
        if (n == 0) {
            if (chunked || has_length) {
                throw RuntimeError("container runtime closed the connection mid-response");
            }
            break;  // Body delimited by connection close
        }
        done = consume(buffer, n);
    }

    return response;
}

std::string DockerClient::create_container(const ContainerSpec& spec, const ExecutionContext& ctx) {
    std::string body = build_create_body(spec);
    DockerResponse resp = perform("POST", "/containers/create", "application/json",
                                  body.data(), body.size(), &ctx, nullptr, true);
    if (resp.status_code != 201) {
        throw RuntimeError(error_message(resp), resp.status_code);
    }

    Json::Value json;
    std::string errors;
    if (!parse_json(resp.body, json, errors) || !json.isObject() || !json["Id"].isString()) {
        throw RuntimeError("unexpected create response: " + resp.body);
    }

    for (const auto& warning : json["Warnings"]) {
        if (warning.isString()) {
            log_warn("[Docker] " + warning.asString());
        }
    }
    return json["Id"].asString();
}

void DockerClient::copy_archive(const std::string& container_id,
                                const std::string& path,
                                const std::vector<uint8_t>& archive,
                                const ExecutionContext& ctx) {
    DockerResponse resp = perform("PUT", containers_path(container_id, "/archive?path=" + url_encode(path)),
                                  "application/x-tar",
                                  reinterpret_cast<const char*>(archive.data()), archive.size(), &ctx);
    if (resp.status_code != 200) {
        throw RuntimeError(error_message(resp), resp.status_code);
    }
}

void DockerClient::start_container(const std::string& container_id, const ExecutionContext& ctx) {
    DockerResponse resp = perform("POST", containers_path(container_id, "/start"), "",
                                  nullptr, 0, &ctx);
    if (resp.status_code != 204 && resp.status_code != 304) {
        throw RuntimeError(error_message(resp), resp.status_code);
    }
}

void DockerClient::stream_logs(const std::string& container_id,
                               bool follow,
                               const ByteHandler& on_bytes,
                               const ExecutionContext& ctx) {
    std::string query = std::string("/logs?stdout=1&stderr=1&timestamps=0&follow=") + (follow ? "1" : "0");
    DockerResponse resp = perform("GET", containers_path(container_id, query), "",
                                  nullptr, 0, &ctx, &on_bytes);
    if (resp.status_code != 200) {
        throw RuntimeError(error_message(resp), resp.status_code);
    }
}

int DockerClient::wait_container(const std::string& container_id, const ExecutionContext& ctx) {
    DockerResponse resp = perform("POST", containers_path(container_id, "/wait?condition=not-running"), "",
                                  nullptr, 0, &ctx);
    if (resp.status_code != 200) {
        throw RuntimeError(error_message(resp), resp.status_code);
    }

    Json::Value json;
    std::string errors;
    if (!parse_json(resp.body, json, errors) || !json.isObject() || !json["StatusCode"].isIntegral()) {
        throw RuntimeError("unexpected wait response: " + resp.body);
    }

    const Json::Value& error = json["Error"];
    if (error.isObject() && error["Message"].isString() && !error["Message"].asString().empty()) {
        throw RuntimeError("container wait error: " + error["Message"].asString());
    }
    return json["StatusCode"].asInt();
}

void DockerClient::remove_container(const std::string& container_id, bool force) {
    DockerResponse resp = perform("DELETE",
                                  containers_path(container_id, force ? "?force=1" : "?force=0"),
                                  "", nullptr, 0, nullptr);
    switch (resp.status_code) {
        case 204:
            return;
        case 404:
            // Auto-removal got there first
            log_info("[Docker] container " + container_id.substr(0, 12) + " already removed");
            return;
        case 409:
            log_info("[Docker] removal of " + container_id.substr(0, 12) + " already in progress");
            return;
        default:
            throw RuntimeError(error_message(resp), resp.status_code);
    }
}

std::string DockerClient::ping() {
    DockerResponse resp = perform("GET", "/version", "", nullptr, 0, nullptr);
    if (resp.status_code != 200) {
        throw RuntimeError(error_message(resp), resp.status_code);
    }

    Json::Value json;
    std::string errors;
    if (!parse_json(resp.body, json, errors) || !json["Version"].isString()) {
        throw RuntimeError("unexpected version response: " + resp.body);
    }
    return json["Version"].asString();
}

} // namespace coderun
