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

// Warden WebSocket Channel - Implementation

#include "ws_channel.hpp"

#include "../core/logging.hpp"
#include "../core/socket.hpp"

namespace warden::gateway {

namespace {

constexpr size_t kReadChunkSize = 16 * 1024;

}  // namespace

using http::WebSocketCloseCode::MESSAGE_TOO_BIG;
using http::WebSocketCloseCode::NORMAL_CLOSURE;
using http::WebSocketCloseCode::NO_STATUS_RECEIVED;
using http::WebSocketCloseCode::PROTOCOL_ERROR;

WebSocketChannel::WebSocketChannel(int fd, Role role, uint64_t max_message_size,
                                   std::vector<uint8_t> initial)
    : fd_(fd), role_(role), max_message_size_(max_message_size), pending_(std::move(initial)) {
    parser_.set_max_payload(max_message_size_);
}

WebSocketChannel::~WebSocketChannel() {
    core::close_fd(fd_);
}

bool WebSocketChannel::read_more() {
    uint8_t chunk[kReadChunkSize];
    std::error_code ec;
    ssize_t n = core::recv_some(fd_, chunk, ec);
    if (n <= 0) {
        return false;
    }

    if (pending_offset_ == pending_.size()) {
        pending_.clear();
        pending_offset_ = 0;
    }
    pending_.insert(pending_.end(), chunk, chunk + n);
    return true;
}

void WebSocketChannel::fail(uint16_t code, std::string_view reason) {
    LOG_DEBUG(logging::get_logger(), "WebSocket channel fd={} closing with {}: {}", fd_, code,
              reason);
    close(code, reason);
}

bool WebSocketChannel::receive(Message& message) {
    message.payload.clear();
    bool in_fragment = false;

    while (true) {
        http::WebSocketFrame frame;
        size_t consumed = 0;
        auto result = parser_.parse(std::span<const uint8_t>(pending_).subspan(pending_offset_),
                                    frame, consumed);
        pending_offset_ += consumed;

        if (result == http::WebSocketFrameParser::ParseResult::Error) {
            if (parser_.payload_too_large()) {
                fail(MESSAGE_TOO_BIG, "message too big");
            } else {
                fail(PROTOCOL_ERROR, "protocol error");
            }
            return false;
        }

        if (result == http::WebSocketFrameParser::ParseResult::Incomplete) {
            if (!read_more()) {
                return false;
            }
            continue;
        }

        // Masking direction is fixed by role (RFC 6455 §5.1)
        bool expect_masked = role_ == Role::Server;
        if (frame.masked != expect_masked) {
            parser_.reset();
            fail(PROTOCOL_ERROR, expect_masked ? "unmasked client frame" : "masked server frame");
            return false;
        }

        std::vector<uint8_t> payload(frame.payload.begin(), frame.payload.end());
        if (frame.masked) {
            http::WebSocketUtils::unmask_payload(payload, frame.masking_key);
        }
        uint8_t opcode = frame.opcode;
        bool fin = frame.fin;
        parser_.reset();

        switch (opcode) {
            case http::WebSocketOpcode::PING:
                if (!send_frame(http::WebSocketOpcode::PONG, payload)) {
                    return false;
                }
                continue;

            case http::WebSocketOpcode::PONG:
                continue;

            case http::WebSocketOpcode::CLOSE: {
                uint16_t code = http::WebSocketUtils::parse_close_code(payload);
                peer_close_code_.store(code, std::memory_order_release);
                // Echo the close (1005 must not appear on the wire)
                close(code == NO_STATUS_RECEIVED ? NORMAL_CLOSURE : code);
                return false;
            }

            case http::WebSocketOpcode::CONTINUATION:
                if (!in_fragment) {
                    fail(PROTOCOL_ERROR, "unexpected continuation frame");
                    return false;
                }
                break;

            default:  // TEXT or BINARY
                if (in_fragment) {
                    fail(PROTOCOL_ERROR, "new message inside fragmented message");
                    return false;
                }
                message.opcode = opcode;
                in_fragment = true;
                break;
        }

        if (message.payload.size() + payload.size() > max_message_size_) {
            fail(MESSAGE_TOO_BIG, "message too big");
            return false;
        }
        message.payload.insert(message.payload.end(), payload.begin(), payload.end());

        if (fin) {
            return true;
        }
    }
}

bool WebSocketChannel::send(const Message& message) {
    return send_frame(message.opcode, message.payload);
}

bool WebSocketChannel::send_frame(uint8_t opcode, std::span<const uint8_t> payload) {
    auto frame =
        http::WebSocketUtils::create_frame(opcode, payload, role_ == Role::Client);

    // Checked under the lock so nothing follows a close frame onto the wire
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (close_sent_.load(std::memory_order_acquire)) {
        return false;
    }
    return !core::send_all(fd_, frame);
}

void WebSocketChannel::close(uint16_t code, std::string_view reason) {
    auto frame =
        http::WebSocketUtils::create_close_frame(code, reason, role_ == Role::Client);

    std::lock_guard<std::mutex> lock(send_mutex_);
    if (close_sent_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (auto ec = core::send_all(fd_, frame)) {
        // Peer already gone; nothing left to tell it
        LOG_DEBUG(logging::get_logger(), "Close frame on fd={} not delivered: {}", fd_,
                  ec.message());
    }
}

void WebSocketChannel::shutdown() noexcept {
    core::shutdown_socket(fd_);
}

}  // namespace warden::gateway
