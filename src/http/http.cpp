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

// Warden HTTP Protocol - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>

namespace warden::http {

namespace {

template <typename HeaderList>
const Header* find_in(const HeaderList& headers, std::string_view name) noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? header->value : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

bool Request::keep_alive() const noexcept {
    auto connection = get_header("Connection");

    if (version == Version::HTTP_1_1) {
        return !header_value_contains(connection, "close");
    }

    // HTTP/1.0 defaults to close
    return header_value_contains(connection, "keep-alive");
}

void Request::clear() {
    method = Method::UNKNOWN;
    version = Version::HTTP_1_1;
    method_name = {};
    uri = {};
    path = {};
    query = {};
    headers.clear();
    body_storage.clear();
    body = {};
    upgrade = false;
}

// Response helper methods

const Header* Response::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? header->value : default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

void Response::clear() {
    version = Version::HTTP_1_1;
    status = 200;
    reason_phrase = {};
    headers.clear();
    body_storage.clear();
    body = {};
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (str == "GET")
        return Method::GET;
    if (str == "POST")
        return Method::POST;
    if (str == "PUT")
        return Method::PUT;
    if (str == "DELETE")
        return Method::DELETE;
    if (str == "HEAD")
        return Method::HEAD;
    if (str == "OPTIONS")
        return Method::OPTIONS;
    if (str == "PATCH")
        return Method::PATCH;
    if (str == "CONNECT")
        return Method::CONNECT;
    if (str == "TRACE")
        return Method::TRACE;
    return Method::UNKNOWN;
}

std::string_view to_string(Version version) noexcept {
    switch (version) {
        case Version::HTTP_1_0:
            return "HTTP/1.0";
        case Version::HTTP_1_1:
            return "HTTP/1.1";
        case Version::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string_view to_reason_phrase(uint16_t code) noexcept {
    switch (code) {
        case 100:
            return "Continue";
        case 101:
            return "Switching Protocols";
        case 200:
            return "OK";
        case 201:
            return "Created";
        case 202:
            return "Accepted";
        case 204:
            return "No Content";
        case 301:
            return "Moved Permanently";
        case 302:
            return "Found";
        case 303:
            return "See Other";
        case 304:
            return "Not Modified";
        case 307:
            return "Temporary Redirect";
        case 308:
            return "Permanent Redirect";
        case 400:
            return "Bad Request";
        case 401:
            return "Unauthorized";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 408:
            return "Request Timeout";
        case 413:
            return "Payload Too Large";
        case 426:
            return "Upgrade Required";
        case 429:
            return "Too Many Requests";
        case 500:
            return "Internal Server Error";
        case 501:
            return "Not Implemented";
        case 502:
            return "Bad Gateway";
        case 503:
            return "Service Unavailable";
        case 504:
            return "Gateway Timeout";
        default:
            return "Unknown";
    }
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

bool header_value_contains(std::string_view value, std::string_view token) noexcept {
    while (!value.empty()) {
        size_t comma = value.find(',');
        std::string_view item = trim(value.substr(0, comma));
        if (header_name_equals(item, token)) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        value.remove_prefix(comma + 1);
    }
    return false;
}

}  // namespace warden::http
