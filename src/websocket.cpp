#include "websocket.h"
#include <cctype>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <unistd.h>
#include <poll.h>
#include <sys/socket.h>
#include <cerrno>

namespace coderun {

// Base64 encoding table
static const char base64_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

std::string WebSocketManager::base64_encode(const unsigned char* data, size_t len) {
    std::string ret;
    int i = 0;
    int j = 0;
    unsigned char char_array_3[3];
    unsigned char char_array_4[4];

    while (len--) {
        char_array_3[i++] = *(data++);
        if (i == 3) {
            char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
            char_array_4[1] = ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
            char_array_4[2] = ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);
            char_array_4[3] = char_array_3[2] & 0x3f;

            for (i = 0; i < 4; i++)
                ret += base64_chars[char_array_4[i]];
            i = 0;
        }
    }

    if (i) {
        for (j = i; j < 3; j++)
            char_array_3[j] = '\0';

        char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
        char_array_4[1] = ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
        char_array_4[2] = ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);

        for (j = 0; j < i + 1; j++)
            ret += base64_chars[char_array_4[j]];

        while (i++ < 3)
            ret += '=';
    }

    return ret;
}

bool WebSocketManager::is_websocket_upgrade(const std::map<std::string, std::string>& headers) {
    auto upgrade_it = headers.find("Upgrade");
    auto connection_it = headers.find("Connection");

    if (upgrade_it == headers.end() || connection_it == headers.end()) {
        return false;
    }

    // Case-insensitive comparison
    std::string upgrade = upgrade_it->second;
    std::string connection = connection_it->second;

    // Convert to lowercase
    for (auto& c : upgrade) c = tolower(c);
    for (auto& c : connection) c = tolower(c);

    return upgrade == "websocket" && connection.find("upgrade") != std::string::npos;
}

std::string WebSocketManager::create_handshake_response(const std::string& sec_key) {
    // WebSocket magic string
    const std::string magic = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    std::string combined = sec_key + magic;

    // SHA-1 hash
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(combined.c_str()), combined.length(), hash);

    // Base64 encode
    std::string accept_key = base64_encode(hash, SHA_DIGEST_LENGTH);

    // Build response
    std::ostringstream response;
    response << "HTTP/1.1 101 Switching Protocols\r\n"
             << "Upgrade: websocket\r\n"
             << "Connection: Upgrade\r\n"
             << "Sec-WebSocket-Accept: " << accept_key << "\r\n"
             << "\r\n";

    return response.str();
}

std::vector<uint8_t> WebSocketManager::create_frame(WSOpcode opcode, const std::string& payload) {
    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 10);

    // First byte: FIN bit + opcode
    frame.push_back(0x80 | static_cast<uint8_t>(opcode));

    // Payload length
    size_t payload_len = payload.size();
    if (payload_len <= 125) {
        frame.push_back(static_cast<uint8_t>(payload_len));
    } else if (payload_len <= 65535) {
        frame.push_back(126);
        frame.push_back((payload_len >> 8) & 0xFF);
        frame.push_back(payload_len & 0xFF);
    } else {
        frame.push_back(127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back((payload_len >> (i * 8)) & 0xFF);
        }
    }

    // Payload data
    frame.insert(frame.end(), payload.begin(), payload.end());

    return frame;
}

bool WebSocketManager::write_frame(int client_fd, const std::vector<uint8_t>& frame) {
    size_t sent = 0;
    while (sent < frame.size()) {
        // MSG_NOSIGNAL: a vanished client must not raise SIGPIPE
        ssize_t n = send(client_fd, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool WebSocketManager::send_text(int client_fd, const std::string& message) {
    return write_frame(client_fd, create_frame(WSOpcode::TEXT, message));
}

bool WebSocketManager::send_close(int client_fd, WSCloseCode code, const std::string& reason) {
    // Status code (network order) followed by at most 123 bytes of reason
    std::string payload;
    uint16_t status = static_cast<uint16_t>(code);
    payload.push_back(static_cast<char>((status >> 8) & 0xFF));
    payload.push_back(static_cast<char>(status & 0xFF));
    payload += reason.substr(0, 123);
    return write_frame(client_fd, create_frame(WSOpcode::CLOSE, payload));
}

bool WebSocketManager::send_pong(int client_fd, const std::string& payload) {
    return write_frame(client_fd, create_frame(WSOpcode::PONG, payload.substr(0, 125)));
}

bool WebSocketManager::wait_readable(int client_fd, int timeout_ms) {
    pollfd pfd{client_fd, POLLIN, 0};
    int ready = poll(&pfd, 1, timeout_ms);
    if (ready < 0) {
        return errno != EINTR;
    }
    return ready > 0;
}

namespace {

// Read exactly len bytes; false on EOF or error
bool read_exact(int fd, uint8_t* buffer, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = read(fd, buffer + total, len - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

std::string WebSocketManager::read_frame(int client_fd, bool& is_close, WSOpcode* opcode,
                                         size_t max_payload) {
    is_close = false;

    // Read first 2 bytes
    uint8_t header[2];
    if (!read_exact(client_fd, header, 2)) {
        is_close = true;
        return "";
    }

    // Parse opcode
    uint8_t op = header[0] & 0x0F;
    if (opcode) *opcode = static_cast<WSOpcode>(op);

    // Parse payload length
    bool masked = (header[1] & 0x80) != 0;
    uint64_t payload_len = header[1] & 0x7F;

    if (payload_len == 126) {
        uint8_t len_bytes[2];
        if (!read_exact(client_fd, len_bytes, 2)) {
            is_close = true;
            return "";
        }
        payload_len = (len_bytes[0] << 8) | len_bytes[1];
    } else if (payload_len == 127) {
        uint8_t len_bytes[8];
        if (!read_exact(client_fd, len_bytes, 8)) {
            is_close = true;
            return "";
        }
        payload_len = 0;
        for (int i = 0; i < 8; i++) {
            payload_len = (payload_len << 8) | len_bytes[i];
        }
    }

    if (payload_len > max_payload) {
        is_close = true;
        return "";
    }

    // Read masking key if present
    uint8_t mask[4] = {0};
    if (masked) {
        if (!read_exact(client_fd, mask, 4)) {
            is_close = true;
            return "";
        }
    }

    // Read payload
    std::vector<uint8_t> payload(payload_len);
    if (payload_len > 0 && !read_exact(client_fd, payload.data(), payload_len)) {
        is_close = true;
        return "";
    }

    // Unmask if needed
    if (masked) {
        for (size_t i = 0; i < payload_len; i++) {
            payload[i] ^= mask[i % 4];
        }
    }

    if (op == static_cast<uint8_t>(WSOpcode::CLOSE)) {
        is_close = true;
    }

    return std::string(payload.begin(), payload.end());
}

} // namespace coderun
