#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <openssl/sha.h>
#include <arpa/inet.h>

namespace coderun {

// WebSocket frame opcodes
enum class WSOpcode : uint8_t {
    CONTINUATION = 0x0,
    TEXT = 0x1,
    BINARY = 0x2,
    CLOSE = 0x8,
    PING = 0x9,
    PONG = 0xA
};

// Close status codes (RFC 6455 section 7.4.1)
enum class WSCloseCode : uint16_t {
    NORMAL = 1000,
    GOING_AWAY = 1001,
    INVALID_PAYLOAD = 1007,
    POLICY_VIOLATION = 1008,
    MESSAGE_TOO_BIG = 1009,
    INTERNAL_ERROR = 1011
};

// Server side of the WebSocket protocol over a connected socket.
// Writers on the same descriptor must be serialized by the caller.
class WebSocketManager {
public:
    // Check if request is WebSocket upgrade
    static bool is_websocket_upgrade(const std::map<std::string, std::string>& headers);

    // Perform WebSocket handshake
    static std::string create_handshake_response(const std::string& sec_key);

    // Send text frame to client
    static bool send_text(int client_fd, const std::string& message);

    // Send close frame with status code and reason phrase
    static bool send_close(int client_fd, WSCloseCode code = WSCloseCode::NORMAL,
                           const std::string& reason = "");

    static bool send_pong(int client_fd, const std::string& payload);

    // Read and decode incoming frame. is_close is set on a close frame,
    // on EOF, on a read error, and on a frame larger than max_payload.
    static std::string read_frame(int client_fd, bool& is_close,
                                  WSOpcode* opcode = nullptr,
                                  size_t max_payload = SIZE_MAX);

    // Wait up to timeout_ms for the client to send something.
    // Also true on hangup so the next read observes the close.
    static bool wait_readable(int client_fd, int timeout_ms);

    // Create WebSocket frame (unmasked, server to client)
    static std::vector<uint8_t> create_frame(WSOpcode opcode, const std::string& payload);

private:
    // Base64 encoding for WebSocket handshake
    static std::string base64_encode(const unsigned char* data, size_t len);

    static bool write_frame(int client_fd, const std::vector<uint8_t>& frame);
};

} // namespace coderun
