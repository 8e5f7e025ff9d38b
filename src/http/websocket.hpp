/*
 * Copyright 2025 Warden Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Warden WebSocket - Header
// WebSocket protocol support (RFC 6455): handshake helpers, frame encoding, frame parsing

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::http {

struct Request;
struct Response;

/// WebSocket frame opcodes (RFC 6455 §5.2)
namespace WebSocketOpcode {
constexpr uint8_t CONTINUATION = 0x0;
constexpr uint8_t TEXT = 0x1;
constexpr uint8_t BINARY = 0x2;
constexpr uint8_t CLOSE = 0x8;
constexpr uint8_t PING = 0x9;
constexpr uint8_t PONG = 0xA;
}  // namespace WebSocketOpcode

/// WebSocket close status codes (RFC 6455 §7.4)
namespace WebSocketCloseCode {
constexpr uint16_t NORMAL_CLOSURE = 1000;
constexpr uint16_t GOING_AWAY = 1001;
constexpr uint16_t PROTOCOL_ERROR = 1002;
constexpr uint16_t UNSUPPORTED_DATA = 1003;
constexpr uint16_t NO_STATUS_RECEIVED = 1005;  // Reserved, never sent
constexpr uint16_t ABNORMAL_CLOSURE = 1006;    // Reserved, never sent
constexpr uint16_t INVALID_FRAME_PAYLOAD = 1007;
constexpr uint16_t POLICY_VIOLATION = 1008;
constexpr uint16_t MESSAGE_TOO_BIG = 1009;
constexpr uint16_t INTERNAL_SERVER_ERROR = 1011;
}  // namespace WebSocketCloseCode

/// WebSocket frame structure (RFC 6455 §5.2)
struct WebSocketFrame {
    bool fin = false;
    uint8_t opcode = 0;
    bool masked = false;
    uint32_t masking_key = 0;
    uint64_t payload_length = 0;
    std::span<const uint8_t> payload;  // View into the parser's frame buffer (still masked)

    [[nodiscard]] constexpr bool is_control_frame() const noexcept { return opcode >= 0x8; }

    [[nodiscard]] constexpr bool is_data_frame() const noexcept { return opcode <= 0x2; }
};

/// WebSocket handshake validation and utilities
class WebSocketUtils {
public:
    /// Compute Sec-WebSocket-Accept header value (RFC 6455 §4.2.2)
    /// Accept-Value = Base64(SHA1(Key + "258EAFA5-E914-47DA-95CA-C5AB0DC85B11"))
    [[nodiscard]] static std::string compute_accept_key(std::string_view sec_websocket_key);

    /// Generate a client Sec-WebSocket-Key (Base64 of 16 random bytes)
    [[nodiscard]] static std::string generate_client_key();

    /// Random 32-bit masking key for client frames
    [[nodiscard]] static uint32_t generate_masking_key();

    /// Validate WebSocket upgrade request headers
    [[nodiscard]] static bool is_valid_upgrade_request(const Request& request);

    /// Validate a server handshake response against the key we sent
    [[nodiscard]] static bool is_valid_upgrade_response(const Response& response,
                                                        std::string_view sec_websocket_key);

    /// Create 101 Switching Protocols response
    [[nodiscard]] static std::string create_upgrade_response(std::string_view accept_key,
                                                             std::string_view protocol = "");

    /// XOR payload with masking key; masking and unmasking are the same operation
    static void unmask_payload(std::span<uint8_t> payload, uint32_t masking_key) noexcept;

    /// Encode a complete frame. Masked frames get a fresh random key.
    [[nodiscard]] static std::vector<uint8_t> create_frame(uint8_t opcode,
                                                           std::span<const uint8_t> payload,
                                                           bool mask, bool fin = true);

    /// Create WebSocket close frame
    [[nodiscard]] static std::vector<uint8_t> create_close_frame(uint16_t status_code,
                                                                 std::string_view reason,
                                                                 bool mask = false);

    /// Create WebSocket pong frame (echoes the ping payload)
    [[nodiscard]] static std::vector<uint8_t> create_pong_frame(
        std::span<const uint8_t> ping_payload, bool mask = false);

    /// Create WebSocket ping frame
    [[nodiscard]] static std::vector<uint8_t> create_ping_frame(bool mask = false);

    /// Status code carried by a close frame payload, NO_STATUS_RECEIVED when absent
    [[nodiscard]] static uint16_t parse_close_code(std::span<const uint8_t> payload) noexcept;

    /// Encode WebSocket frame header
    static void encode_frame_header(std::vector<uint8_t>& buffer, bool fin, uint8_t opcode,
                                    bool mask, uint64_t payload_length, uint32_t masking_key = 0);
};

/// WebSocket frame parser
class WebSocketFrameParser {
public:
    enum class ParseResult {
        Complete,    // Full frame parsed successfully
        Incomplete,  // Need more data (partial frame)
        Error        // Protocol violation (close connection)
    };

    WebSocketFrameParser() = default;
    ~WebSocketFrameParser() = default;

    /// Parse WebSocket frame from data
    /// @param data Input data buffer
    /// @param out_frame Parsed frame (only valid if result is Complete, until reset())
    /// @param consumed Number of bytes consumed from input
    [[nodiscard]] ParseResult parse(std::span<const uint8_t> data, WebSocketFrame& out_frame,
                                    size_t& consumed);

    /// Frames declaring a larger payload are rejected (0 = unlimited)
    void set_max_payload(uint64_t max_payload) noexcept { max_payload_ = max_payload; }

    /// Reset parser state (required after each Complete frame)
    void reset();

    /// Last Error came from a payload over the max_payload limit
    [[nodiscard]] bool payload_too_large() const noexcept { return payload_too_large_; }

    [[nodiscard]] const char* state_name() const noexcept;

private:
    enum class State {
        ReadHeader,
        ReadExtendedLen16,
        ReadExtendedLen64,
        ReadMaskingKey,
        ReadPayload,
        Complete
    };

    State state_ = State::ReadHeader;
    std::vector<uint8_t> buffer_;

    bool fin_ = false;
    uint8_t opcode_ = 0;
    bool masked_ = false;
    uint64_t payload_length_ = 0;
    uint32_t masking_key_ = 0;
    size_t header_size_ = 0;
    uint64_t max_payload_ = 0;
    bool payload_too_large_ = false;
};

}  // namespace warden::http
