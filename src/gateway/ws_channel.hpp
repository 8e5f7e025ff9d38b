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

// Warden WebSocket Channel - Header
// Message-level WebSocket endpoint over an already upgraded socket.

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <vector>

#include "../http/websocket.hpp"

namespace warden::gateway {

/// One complete WebSocket message (fragments already joined)
struct Message {
    uint8_t opcode = http::WebSocketOpcode::TEXT;
    std::vector<uint8_t> payload;
};

/// Upgraded socket speaking RFC 6455 frames.
///
/// One thread may receive while another sends; sends (including automatic
/// pong and close replies) are serialized internally. Owns and closes the fd.
class WebSocketChannel {
public:
    enum class Role : uint8_t {
        Server,  // Accepted connection: peer frames are masked, ours are not
        Client   // Dialed connection: we mask, peer must not
    };

    /// `initial` holds bytes already read past the handshake
    WebSocketChannel(int fd, Role role, uint64_t max_message_size,
                     std::vector<uint8_t> initial = {});
    ~WebSocketChannel();

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    /// Next data message. Returns false when the peer closed, the socket
    /// failed, or the peer broke the protocol (a close frame is sent for the latter).
    [[nodiscard]] bool receive(Message& message);

    /// Send one message as a single frame
    [[nodiscard]] bool send(const Message& message);

    /// Send a close frame once (best effort)
    void close(uint16_t code, std::string_view reason = {});

    /// Wake a blocked receive() and stop further I/O
    void shutdown() noexcept;

    /// Close code from the peer's close frame (0 if none arrived)
    [[nodiscard]] uint16_t peer_close_code() const noexcept {
        return peer_close_code_.load(std::memory_order_acquire);
    }

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] Role role() const noexcept { return role_; }

private:
    [[nodiscard]] bool send_frame(uint8_t opcode, std::span<const uint8_t> payload);
    [[nodiscard]] bool read_more();
    void fail(uint16_t code, std::string_view reason);

    int fd_;
    Role role_;
    uint64_t max_message_size_;

    std::vector<uint8_t> pending_;  // Received bytes not yet handed to the frame parser
    size_t pending_offset_ = 0;
    http::WebSocketFrameParser parser_;

    std::mutex send_mutex_;
    std::atomic<bool> close_sent_{false};
    std::atomic<uint16_t> peer_close_code_{0};
};

}  // namespace warden::gateway
