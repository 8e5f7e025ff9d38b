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

// Warden HTTP Protocol - Header
// HTTP/1.x value types. Header and target fields are views into the
// connection's receive buffer; bodies are owned once parsing completes.

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP version
enum class Version : uint8_t { HTTP_1_0, HTTP_1_1, UNKNOWN };

/// HTTP status codes used by the proxy itself. Backend statuses are relayed
/// as-is and may fall outside this list.
enum class StatusCode : uint16_t {
    Continue = 100,
    SwitchingProtocols = 101,

    OK = 200,
    NoContent = 204,

    MovedPermanently = 301,
    Found = 302,
    NotModified = 304,

    BadRequest = 400,
    NotFound = 404,
    RequestTimeout = 408,
    PayloadTooLarge = 413,
    UpgradeRequired = 426,

    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504,
};

/// HTTP header (name-value pair), both views into the parse buffer
struct Header {
    std::string_view name;
    std::string_view value;
};

/// HTTP request
struct Request {
    Method method = Method::UNKNOWN;
    Version version = Version::HTTP_1_1;

    // Method token exactly as llhttp recognised it (covers methods outside the enum)
    std::string_view method_name;

    std::string_view uri;
    std::string_view path;   // URI without query string
    std::string_view query;  // Query string without '?'

    std::vector<Header> headers;

    // Decoded body (chunked framing removed)
    std::vector<uint8_t> body_storage;
    std::span<const uint8_t> body;

    /// Set when the request carried an Upgrade header that llhttp accepted
    bool upgrade = false;

    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    /// Connection persistence per HTTP/1.0 and HTTP/1.1 defaults
    [[nodiscard]] bool keep_alive() const noexcept;

    void clear();
};

/// HTTP response as parsed from a backend
struct Response {
    Version version = Version::HTTP_1_1;
    uint16_t status = 200;
    std::string_view reason_phrase;

    std::vector<Header> headers;

    std::vector<uint8_t> body_storage;
    std::span<const uint8_t> body;

    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    void clear();
};

// Conversion functions

[[nodiscard]] std::string_view to_string(Method method) noexcept;

[[nodiscard]] Method parse_method(std::string_view str) noexcept;

[[nodiscard]] std::string_view to_string(Version version) noexcept;

/// Reason phrase for a status code ("Unknown" for codes without one)
[[nodiscard]] std::string_view to_reason_phrase(uint16_t code) noexcept;

[[nodiscard]] inline std::string_view to_reason_phrase(StatusCode code) noexcept {
    return to_reason_phrase(static_cast<uint16_t>(code));
}

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// Case-insensitive search of a token inside a comma separated header value
[[nodiscard]] bool header_value_contains(std::string_view value, std::string_view token) noexcept;

}  // namespace warden::http
