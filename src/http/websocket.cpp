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

// Warden WebSocket - Implementation
// WebSocket protocol support (RFC 6455)

#include "websocket.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <random>

#include "http.hpp"

namespace warden::http {

namespace {

/// Magic GUID for WebSocket handshake (RFC 6455 §4.2.2)
constexpr std::string_view WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

/// Base64 encode binary data
std::string base64_encode(const unsigned char* data, size_t length) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data, static_cast<int>(length));
    (void)BIO_flush(bio);

    char* encoded_data = nullptr;
    long encoded_length = BIO_get_mem_data(bio, &encoded_data);

    std::string result(encoded_data, static_cast<size_t>(encoded_length));

    BIO_free_all(bio);

    return result;
}

void random_bytes(unsigned char* out, size_t length) {
    if (RAND_bytes(out, static_cast<int>(length)) == 1) {
        return;
    }
    // RAND_bytes only fails when the CSPRNG cannot be seeded
    static thread_local std::mt19937 rng{std::random_device{}()};
    for (size_t i = 0; i < length; ++i) {
        out[i] = static_cast<unsigned char>(rng() & 0xFF);
    }
}

}  // namespace

// ========================================
// WebSocketUtils Implementation
// ========================================

std::string WebSocketUtils::compute_accept_key(std::string_view sec_websocket_key) {
    std::string concat;
    concat.reserve(sec_websocket_key.size() + WEBSOCKET_GUID.size());
    concat.append(sec_websocket_key);
    concat.append(WEBSOCKET_GUID);

    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(concat.data()), concat.size(), hash);

    return base64_encode(hash, SHA_DIGEST_LENGTH);
}

std::string WebSocketUtils::generate_client_key() {
    std::array<unsigned char, 16> nonce{};
    random_bytes(nonce.data(), nonce.size());
    return base64_encode(nonce.data(), nonce.size());
}

uint32_t WebSocketUtils::generate_masking_key() {
    std::array<unsigned char, 4> key{};
    random_bytes(key.data(), key.size());
    return (static_cast<uint32_t>(key[0]) << 24) | (static_cast<uint32_t>(key[1]) << 16) |
           (static_cast<uint32_t>(key[2]) << 8) | key[3];
}

bool WebSocketUtils::is_valid_upgrade_request(const Request& request) {
    // RFC 6455 §4.2.1: Client handshake requirements
    if (request.method != Method::GET) {
        return false;
    }

    if (!header_name_equals(request.get_header("Upgrade"), "websocket")) {
        return false;
    }

    // Connection may list other tokens besides Upgrade
    if (!header_value_contains(request.get_header("Connection"), "upgrade")) {
        return false;
    }

    if (request.get_header("Sec-WebSocket-Key").empty()) {
        return false;
    }

    // Only version 13 is supported (RFC 6455)
    return request.get_header("Sec-WebSocket-Version") == "13";
}

bool WebSocketUtils::is_valid_upgrade_response(const Response& response,
                                               std::string_view sec_websocket_key) {
    // RFC 6455 §4.1: client-side validation of the server handshake
    if (response.status != 101) {
        return false;
    }
    if (!header_name_equals(response.get_header("Upgrade"), "websocket")) {
        return false;
    }
    if (!header_value_contains(response.get_header("Connection"), "upgrade")) {
        return false;
    }
    return response.get_header("Sec-WebSocket-Accept") == compute_accept_key(sec_websocket_key);
}

std::string WebSocketUtils::create_upgrade_response(std::string_view accept_key,
                                                    std::string_view protocol) {
    std::string response;
    response.reserve(256);

    response += "HTTP/1.1 101 Switching Protocols\r\n";
    response += "Upgrade: websocket\r\n";
    response += "Connection: Upgrade\r\n";
    response += "Sec-WebSocket-Accept: ";
    response += accept_key;
    response += "\r\n";

    if (!protocol.empty()) {
        response += "Sec-WebSocket-Protocol: ";
        response += protocol;
        response += "\r\n";
    }

    response += "\r\n";

    return response;
}

void WebSocketUtils::unmask_payload(std::span<uint8_t> payload, uint32_t masking_key) noexcept {
    // RFC 6455 §5.3: transformed-octet-i = original-octet-i XOR masking-key-octet-(i % 4)
    // Key octet 0 is the most significant byte, matching the wire order
    const uint8_t key[4] = {static_cast<uint8_t>(masking_key >> 24),
                            static_cast<uint8_t>(masking_key >> 16),
                            static_cast<uint8_t>(masking_key >> 8),
                            static_cast<uint8_t>(masking_key)};
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] ^= key[i & 3];
    }
}

std::vector<uint8_t> WebSocketUtils::create_frame(uint8_t opcode, std::span<const uint8_t> payload,
                                                  bool mask, bool fin) {
    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 14);

    uint32_t masking_key = mask ? generate_masking_key() : 0;
    encode_frame_header(frame, fin, opcode, mask, payload.size(), masking_key);

    size_t payload_offset = frame.size();
    frame.insert(frame.end(), payload.begin(), payload.end());

    if (mask) {
        unmask_payload(std::span<uint8_t>(frame.data() + payload_offset, payload.size()),
                       masking_key);
    }

    return frame;
}

std::vector<uint8_t> WebSocketUtils::create_close_frame(uint16_t status_code,
                                                        std::string_view reason, bool mask) {
    // RFC 6455 §5.5.1: 2-byte status code + optional UTF-8 reason, at most 125 bytes
    std::vector<uint8_t> payload;
    payload.push_back(static_cast<uint8_t>(status_code >> 8));
    payload.push_back(static_cast<uint8_t>(status_code & 0xFF));
    reason = reason.substr(0, 123);
    payload.insert(payload.end(), reason.begin(), reason.end());

    return create_frame(WebSocketOpcode::CLOSE, payload, mask);
}

std::vector<uint8_t> WebSocketUtils::create_pong_frame(std::span<const uint8_t> ping_payload,
                                                       bool mask) {
    return create_frame(WebSocketOpcode::PONG, ping_payload, mask);
}

std::vector<uint8_t> WebSocketUtils::create_ping_frame(bool mask) {
    return create_frame(WebSocketOpcode::PING, {}, mask);
}

uint16_t WebSocketUtils::parse_close_code(std::span<const uint8_t> payload) noexcept {
    if (payload.size() < 2) {
        return WebSocketCloseCode::NO_STATUS_RECEIVED;
    }
    return static_cast<uint16_t>((payload[0] << 8) | payload[1]);
}

void WebSocketUtils::encode_frame_header(std::vector<uint8_t>& buffer, bool fin, uint8_t opcode,
                                         bool mask, uint64_t payload_length, uint32_t masking_key) {
    // Byte 0: FIN (1 bit) + RSV1-3 (3 bits) + Opcode (4 bits)
    buffer.push_back(static_cast<uint8_t>((fin ? 0x80 : 0x00) | (opcode & 0x0F)));

    // Byte 1: MASK (1 bit) + Payload length (7 bits)
    uint8_t byte1 = mask ? 0x80 : 0x00;

    if (payload_length <= 125) {
        byte1 |= static_cast<uint8_t>(payload_length);
        buffer.push_back(byte1);
    } else if (payload_length <= 0xFFFF) {
        byte1 |= 126;
        buffer.push_back(byte1);
        buffer.push_back(static_cast<uint8_t>(payload_length >> 8));
        buffer.push_back(static_cast<uint8_t>(payload_length & 0xFF));
    } else {
        byte1 |= 127;
        buffer.push_back(byte1);
        for (int i = 7; i >= 0; --i) {
            buffer.push_back(static_cast<uint8_t>((payload_length >> (i * 8)) & 0xFF));
        }
    }

    if (mask) {
        buffer.push_back(static_cast<uint8_t>(masking_key >> 24));
        buffer.push_back(static_cast<uint8_t>(masking_key >> 16));
        buffer.push_back(static_cast<uint8_t>(masking_key >> 8));
        buffer.push_back(static_cast<uint8_t>(masking_key));
    }
}

// ========================================
// WebSocketFrameParser Implementation
// ========================================

WebSocketFrameParser::ParseResult WebSocketFrameParser::parse(std::span<const uint8_t> data,
                                                              WebSocketFrame& out_frame,
                                                              size_t& consumed) {
    consumed = 0;
    size_t data_offset = 0;

    // Copy up to `target` total header/frame bytes into buffer_
    auto fill_to = [&](size_t target) {
        size_t needed = target > buffer_.size() ? target - buffer_.size() : 0;
        size_t to_copy = std::min(needed, data.size() - data_offset);
        buffer_.insert(buffer_.end(), data.begin() + data_offset,
                       data.begin() + data_offset + to_copy);
        data_offset += to_copy;
        return buffer_.size() >= target;
    };

    while (true) {
        switch (state_) {
            case State::ReadHeader: {
                if (!fill_to(2)) {
                    consumed = data_offset;
                    return ParseResult::Incomplete;
                }

                uint8_t byte0 = buffer_[0];
                uint8_t byte1 = buffer_[1];

                fin_ = (byte0 & 0x80) != 0;
                opcode_ = byte0 & 0x0F;
                masked_ = (byte1 & 0x80) != 0;
                uint8_t payload_len = byte1 & 0x7F;

                // No extensions are negotiated, so RSV bits must be clear
                if ((byte0 & 0x70) != 0) {
                    return ParseResult::Error;
                }
                if (opcode_ > 0x2 && opcode_ < 0x8) {
                    return ParseResult::Error;  // Reserved data opcode
                }
                if (opcode_ > 0xA) {
                    return ParseResult::Error;  // Reserved control opcode
                }
                if (opcode_ >= 0x8 && !fin_) {
                    return ParseResult::Error;  // Fragmented control frame
                }
                if (opcode_ >= 0x8 && payload_len > 125) {
                    return ParseResult::Error;  // Control frame too large
                }

                header_size_ = 2;

                if (payload_len <= 125) {
                    payload_length_ = payload_len;
                    state_ = masked_ ? State::ReadMaskingKey : State::ReadPayload;
                } else if (payload_len == 126) {
                    state_ = State::ReadExtendedLen16;
                    header_size_ += 2;
                } else {
                    state_ = State::ReadExtendedLen64;
                    header_size_ += 8;
                }
                break;
            }

            case State::ReadExtendedLen16: {
                if (!fill_to(4)) {
                    consumed = data_offset;
                    return ParseResult::Incomplete;
                }

                payload_length_ = (static_cast<uint64_t>(buffer_[2]) << 8) | buffer_[3];
                state_ = masked_ ? State::ReadMaskingKey : State::ReadPayload;
                break;
            }

            case State::ReadExtendedLen64: {
                if (!fill_to(10)) {
                    consumed = data_offset;
                    return ParseResult::Incomplete;
                }

                payload_length_ = 0;
                for (int i = 0; i < 8; ++i) {
                    payload_length_ = (payload_length_ << 8) | buffer_[2 + i];
                }

                // Most significant bit must be 0 (RFC 6455 §5.2)
                if (payload_length_ & (1ULL << 63)) {
                    return ParseResult::Error;
                }

                state_ = masked_ ? State::ReadMaskingKey : State::ReadPayload;
                break;
            }

            case State::ReadMaskingKey: {
                if (!fill_to(header_size_ + 4)) {
                    consumed = data_offset;
                    return ParseResult::Incomplete;
                }

                size_t key_offset = header_size_;
                masking_key_ = (static_cast<uint32_t>(buffer_[key_offset]) << 24) |
                               (static_cast<uint32_t>(buffer_[key_offset + 1]) << 16) |
                               (static_cast<uint32_t>(buffer_[key_offset + 2]) << 8) |
                               buffer_[key_offset + 3];

                header_size_ += 4;
                state_ = State::ReadPayload;
                break;
            }

            case State::ReadPayload: {
                if (max_payload_ != 0 && payload_length_ > max_payload_) {
                    payload_too_large_ = true;
                    return ParseResult::Error;
                }

                if (!fill_to(header_size_ + payload_length_)) {
                    consumed = data_offset;
                    return ParseResult::Incomplete;
                }

                out_frame.fin = fin_;
                out_frame.opcode = opcode_;
                out_frame.masked = masked_;
                out_frame.masking_key = masking_key_;
                out_frame.payload_length = payload_length_;
                out_frame.payload =
                    payload_length_ > 0
                        ? std::span<const uint8_t>(buffer_.data() + header_size_, payload_length_)
                        : std::span<const uint8_t>();

                consumed = data_offset;
                state_ = State::Complete;
                return ParseResult::Complete;
            }

            case State::Complete: {
                // Caller must reset() after consuming a Complete frame
                return ParseResult::Error;
            }
        }
    }
}

void WebSocketFrameParser::reset() {
    state_ = State::ReadHeader;
    buffer_.clear();
    fin_ = false;
    opcode_ = 0;
    masked_ = false;
    payload_length_ = 0;
    masking_key_ = 0;
    header_size_ = 0;
    payload_too_large_ = false;
}

const char* WebSocketFrameParser::state_name() const noexcept {
    switch (state_) {
        case State::ReadHeader:
            return "ReadHeader";
        case State::ReadExtendedLen16:
            return "ReadExtendedLen16";
        case State::ReadExtendedLen64:
            return "ReadExtendedLen64";
        case State::ReadMaskingKey:
            return "ReadMaskingKey";
        case State::ReadPayload:
            return "ReadPayload";
        case State::Complete:
            return "Complete";
    }
    return "Unknown";
}

}  // namespace warden::http
