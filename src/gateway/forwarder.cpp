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

// Warden HTTP Forwarder - Implementation

#include "forwarder.hpp"

#include <poll.h>

#include <fmt/format.h>

#include <cerrno>

#include "../core/compression.hpp"
#include "../core/containers.hpp"
#include "../core/logging.hpp"
#include "../core/socket.hpp"
#include "../http/parser.hpp"

namespace warden::gateway {

namespace {

// Request building constants
constexpr size_t kRequestLineBaseSize = 32;
constexpr size_t kHeaderSeparatorSize = 4;  // ": " + "\r\n"
constexpr size_t kRequestHeaderMargin = 96;

constexpr size_t kBackendReadChunkSize = 16 * 1024;
constexpr size_t kBackendResponseBufferSize = 16 * 1024;

const core::fast_set<std::string_view>& excluded_response_headers() {
    static const core::fast_set<std::string_view> headers = {
        "content-encoding", "content-length", "transfer-encoding", "connection"};
    return headers;
}

/// Headers rebuilt by build_backend_request instead of copied
bool is_rebuilt_request_header(std::string_view name) noexcept {
    return http::header_name_equals(name, "Host") ||
           http::header_name_equals(name, "Content-Length") ||
           http::header_name_equals(name, "Transfer-Encoding") ||
           http::header_name_equals(name, "Connection") ||
           http::header_name_equals(name, "Expect");
}

/// Absolute-form targets ("http://host/path") are sent in origin form
std::string_view origin_form(std::string_view path) noexcept {
    if (!path.empty() && path.front() == '/') {
        return path;
    }
    auto scheme = path.find("://");
    if (scheme == std::string_view::npos) {
        return path;
    }
    auto slash = path.find('/', scheme + 3);
    return slash == std::string_view::npos ? std::string_view{} : path.substr(slash);
}

bool method_expects_body(std::string_view method) noexcept {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

}  // namespace

std::string_view ProxyResponse::get_header(std::string_view name) const noexcept {
    for (const auto& [header_name, header_value] : headers) {
        if (http::header_name_equals(header_name, name)) {
            return header_value;
        }
    }
    return {};
}

bool is_excluded_response_header(std::string_view name) noexcept {
    char lowered[32];
    if (name.size() > sizeof(lowered)) {
        return false;
    }
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        lowered[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
    }
    return excluded_response_headers().contains(std::string_view(lowered, name.size()));
}

Forwarder::Forwarder(const control::BackendConfig& backend, const control::ProxyConfig& proxy,
                     control::ProxyMetrics* metrics)
    : host_(backend.host),
      port_(backend.port),
      timeout_(proxy.upstream_timeout_ms),
      max_response_size_(proxy.max_response_size),
      metrics_(metrics) {}

ProxyResponse Forwarder::proxy_error(std::string_view diagnostic) {
    ProxyResponse response;
    response.status = static_cast<uint16_t>(http::StatusCode::BadGateway);
    response.reason = std::string(http::to_reason_phrase(response.status));
    response.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");

    std::string body = fmt::format("Proxy error: {}", diagnostic);
    response.body.assign(body.begin(), body.end());
    return response;
}

std::string Forwarder::build_backend_request(const http::Request& request, std::string_view host,
                                             uint16_t port) {
    std::string req;

    std::string_view method =
        request.method_name.empty() ? http::to_string(request.method) : request.method_name;
    std::string_view path = origin_form(request.path);

    size_t estimated_size = kRequestLineBaseSize + method.size() + path.size() +
                            request.query.size() + kRequestHeaderMargin + request.body.size();
    for (const auto& header : request.headers) {
        estimated_size += header.name.size() + header.value.size() + kHeaderSeparatorSize;
    }
    req.reserve(estimated_size);

    // Request line: METHOD /path[?query] HTTP/1.1
    req += method;
    req += " ";
    if (path.empty()) {
        req += "/";
    } else {
        req += path;
    }
    if (!request.query.empty()) {
        req += "?";
        req += request.query;
    }
    req += " HTTP/1.1\r\n";

    // Backend's own Host
    req += fmt::format("Host: {}:{}\r\n", host, port);

    // Forward remaining headers in their original order (duplicates included)
    for (const auto& header : request.headers) {
        if (is_rebuilt_request_header(header.name)) {
            continue;
        }
        req += header.name;
        req += ": ";
        req += header.value;
        req += "\r\n";
    }

    // The inbound parser already removed any chunked framing
    if (!request.body.empty() || method_expects_body(method)) {
        req += "Content-Length: ";
        req += std::to_string(request.body.size());
        req += "\r\n";
    }

    // One request per backend connection
    req += "Connection: close\r\n";
    req += "\r\n";

    if (!request.body.empty()) {
        req.append(reinterpret_cast<const char*>(request.body.data()), request.body.size());
    }

    return req;
}

ProxyResponse Forwarder::forward(const http::Request& request) const {
    auto* logger = logging::get_logger();
    auto deadline = std::chrono::steady_clock::now() + timeout_;

    auto fail = [&](std::string diagnostic) {
        LOG_WARNING(logger, "Proxy error for {} {}: {}", request.method_name, request.path,
                    diagnostic);
        if (metrics_) {
            metrics_->record_proxy_error();
        }
        return proxy_error(diagnostic);
    };

    std::error_code ec;
    int backend_fd = core::connect_to_backend(host_, port_, timeout_, ec);
    if (backend_fd < 0) {
        return fail(fmt::format("connect to {}:{} failed: {}", host_, port_, ec.message()));
    }

    std::string request_str = build_backend_request(request, host_, port_);

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        core::close_fd(backend_fd);
        return fail(fmt::format("backend did not respond within {} ms", timeout_.count()));
    }

    if (auto send_ec = core::set_socket_timeouts(backend_fd, remaining)) {
        core::close_fd(backend_fd);
        return fail(fmt::format("cannot configure backend socket: {}", send_ec.message()));
    }

    if (auto send_ec = core::send_all(backend_fd, request_str)) {
        core::close_fd(backend_fd);
        return fail(fmt::format("send to backend failed: {}", send_ec.message()));
    }

    bool head_request = request.method == http::Method::HEAD;
    http::Response response;
    std::vector<uint8_t> buffer;
    std::string error;
    bool received =
        receive_backend_response(backend_fd, deadline, head_request, response, buffer, error);
    core::close_fd(backend_fd);

    if (!received) {
        return fail(error);
    }

    ProxyResponse result;
    result.status = response.status;
    result.reason = std::string(response.reason_phrase.empty()
                                    ? http::to_reason_phrase(response.status)
                                    : response.reason_phrase);

    result.headers.reserve(response.headers.size());
    std::string content_encoding;
    for (const auto& header : response.headers) {
        if (http::header_name_equals(header.name, "Content-Encoding")) {
            if (!content_encoding.empty()) {
                content_encoding += ", ";
            }
            content_encoding += header.value;
        }
        if (is_excluded_response_header(header.name)) {
            continue;
        }
        result.headers.emplace_back(std::string(header.name), std::string(header.value));
    }

    // The encoding header is never relayed, so relay the identity representation
    if (!content_encoding.empty() && !response.body_storage.empty()) {
        auto decoded = core::decode_content(content_encoding, response.body_storage,
                                            max_response_size_, ec);
        if (decoded) {
            result.body = std::move(*decoded);
        } else if (ec == std::errc::invalid_argument) {
            // Codings we do not know are relayed as the backend sent them
            LOG_DEBUG(logger, "Relaying '{}' response body undecoded",
                      content_encoding);
            result.body = std::move(response.body_storage);
        } else {
            return fail(fmt::format("cannot decode '{}' response body: {}", content_encoding,
                                    ec.message()));
        }
    } else {
        result.body = std::move(response.body_storage);
    }

    return result;
}

bool Forwarder::receive_backend_response(int backend_fd,
                                         std::chrono::steady_clock::time_point deadline,
                                         bool head_request, http::Response& response,
                                         std::vector<uint8_t>& buffer, std::string& error) const {
    buffer.clear();
    buffer.reserve(kBackendResponseBufferSize);

    http::Parser parser;
    parser.set_skip_body(head_request);
    uint8_t chunk[kBackendReadChunkSize];
    bool need_read = true;

    while (true) {
        if (need_read) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                error = fmt::format("backend did not respond within {} ms", timeout_.count());
                return false;
            }

            pollfd pfd{backend_fd, POLLIN, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ready < 0 && errno != EINTR) {
                error = fmt::format("poll on backend socket failed: {}",
                                    std::error_code(errno, std::generic_category()).message());
                return false;
            }
            if (ready <= 0) {
                continue;
            }

            std::error_code ec;
            ssize_t n = core::recv_some(backend_fd, chunk, ec);
            if (n < 0) {
                error = fmt::format("read from backend failed: {}", ec.message());
                return false;
            }

            if (n == 0) {
                if (buffer.empty()) {
                    error = "backend closed the connection without a response";
                    return false;
                }
                // Bodies without framing end with the connection
                if (parser.finish() == http::ParseResult::Complete) {
                    return true;
                }
                error = "backend closed the connection mid-response";
                return false;
            }

            buffer.insert(buffer.end(), chunk, chunk + n);

            // Safety limit to prevent unbounded memory growth
            if (buffer.size() > max_response_size_) {
                error = fmt::format("backend response exceeds {} bytes", max_response_size_);
                return false;
            }
        }

        // Reset parser and re-parse the entire buffer from scratch
        auto [result, consumed] = parser.parse_response(std::span<const uint8_t>(buffer), response);

        if (result == http::ParseResult::Error) {
            error = fmt::format("malformed response from backend: {}", parser.error_message());
            return false;
        }

        if (result == http::ParseResult::Complete) {
            // Interim responses (100 Continue, 103 Early Hints) precede the real one
            if (response.status >= 100 && response.status < 200 && response.status != 101) {
                buffer.erase(buffer.begin(),
                             buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
                need_read = buffer.empty();
                continue;
            }
            return true;
        }

        need_read = true;
    }
}

}  // namespace warden::gateway
