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

// Warden HTTP Parser - Header
// Wrapper around llhttp. Callers keep the input buffer alive and unmodified
// while they use the parsed views; each parse call starts from a reset parser
// and sees the full accumulated buffer.

#pragma once

#include <llhttp.h>

#include <cstddef>
#include <span>
#include <string_view>
#include <utility>

#include "http.hpp"

namespace warden::http {

/// Parse result
enum class ParseResult : uint8_t {
    Complete,    // One message fully parsed
    Incomplete,  // Need more data
    Error        // Parse error
};

/// HTTP/1.x parser (wraps llhttp)
class Parser {
public:
    Parser();
    ~Parser();

    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;
    Parser(Parser&&) noexcept;
    Parser& operator=(Parser&&) noexcept;

    /// Parse one HTTP request from the start of buffer.
    /// Returns the result and, on Complete, the number of bytes the message used
    /// (pipelined bytes after it are left untouched).
    [[nodiscard]] std::pair<ParseResult, size_t> parse_request(std::span<const uint8_t> data,
                                                               Request& request);

    /// Parse one HTTP response from the start of buffer.
    [[nodiscard]] std::pair<ParseResult, size_t> parse_response(std::span<const uint8_t> data,
                                                                Response& response);

    /// Signal end of input. Completes responses delimited by connection close.
    [[nodiscard]] ParseResult finish();

    /// The next parsed response answers a HEAD request (headers only)
    void set_skip_body(bool skip) noexcept { skip_body_ = skip; }

    /// Reset parser state for the next message
    void reset();

    /// True once the header block of the current message has been parsed
    [[nodiscard]] bool headers_complete() const noexcept { return ctx_.headers_complete; }

    [[nodiscard]] std::string_view error_message() const noexcept;

    [[nodiscard]] llhttp_errno_t error_code() const noexcept;

private:
    static int on_message_begin(llhttp_t* parser);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_status(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value_complete(llhttp_t* parser);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    [[nodiscard]] std::pair<ParseResult, size_t> execute(std::span<const uint8_t> data);

    llhttp_t parser_;
    llhttp_settings_t settings_;

    struct Context {
        Request* request = nullptr;
        Response* response = nullptr;

        // Token bytes may arrive split across llhttp callbacks
        const char* url_start = nullptr;
        size_t url_length = 0;
        const char* status_start = nullptr;
        size_t status_length = 0;
        const char* field_start = nullptr;
        size_t field_length = 0;
        const char* value_start = nullptr;
        size_t value_length = 0;
        bool field_open = false;

        bool skip_body = false;
        bool headers_complete = false;
        bool message_complete = false;
        llhttp_errno_t error = HPE_OK;
    };

    Context ctx_;
    llhttp_type_t parser_type_ = HTTP_REQUEST;
    bool skip_body_ = false;
};

}  // namespace warden::http
