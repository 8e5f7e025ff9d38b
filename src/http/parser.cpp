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

// Warden HTTP Parser - Implementation

#include "parser.hpp"

namespace warden::http {

namespace {

Version version_from(uint8_t major, uint8_t minor) noexcept {
    if (major == 1 && minor == 0) {
        return Version::HTTP_1_0;
    }
    if (major == 1 && minor == 1) {
        return Version::HTTP_1_1;
    }
    return Version::UNKNOWN;
}

Method method_from(uint8_t method) noexcept {
    switch (method) {
        case HTTP_GET: return Method::GET;
        case HTTP_POST: return Method::POST;
        case HTTP_PUT: return Method::PUT;
        case HTTP_DELETE: return Method::DELETE;
        case HTTP_HEAD: return Method::HEAD;
        case HTTP_OPTIONS: return Method::OPTIONS;
        case HTTP_PATCH: return Method::PATCH;
        case HTTP_CONNECT: return Method::CONNECT;
        case HTTP_TRACE: return Method::TRACE;
        default: return Method::UNKNOWN;
    }
}

// Extend a token view when llhttp reports it in several contiguous pieces
void append_span(const char*& start, size_t& length, const char* at, size_t n) {
    if (start == nullptr) {
        start = at;
        length = n;
    } else {
        length += n;
    }
}

}  // namespace

Parser::Parser() {
    llhttp_settings_init(&settings_);

    settings_.on_message_begin = on_message_begin;
    settings_.on_url = on_url;
    settings_.on_status = on_status;
    settings_.on_header_field = on_header_field;
    settings_.on_header_value = on_header_value;
    settings_.on_header_value_complete = on_header_value_complete;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_body = on_body;
    settings_.on_message_complete = on_message_complete;

    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = &ctx_;
}

Parser::~Parser() = default;

Parser::Parser(Parser&& other) noexcept
    : parser_(other.parser_),
      settings_(other.settings_),
      ctx_(other.ctx_),
      parser_type_(other.parser_type_),
      skip_body_(other.skip_body_) {
    parser_.settings = &settings_;
    parser_.data = &ctx_;
}

Parser& Parser::operator=(Parser&& other) noexcept {
    if (this != &other) {
        parser_ = other.parser_;
        settings_ = other.settings_;
        ctx_ = other.ctx_;
        parser_type_ = other.parser_type_;
        skip_body_ = other.skip_body_;
        parser_.settings = &settings_;
        parser_.data = &ctx_;
    }
    return *this;
}

std::pair<ParseResult, size_t> Parser::parse_request(std::span<const uint8_t> data,
                                                     Request& request) {
    parser_type_ = HTTP_REQUEST;
    reset();
    ctx_.request = &request;
    return execute(data);
}

std::pair<ParseResult, size_t> Parser::parse_response(std::span<const uint8_t> data,
                                                      Response& response) {
    parser_type_ = HTTP_RESPONSE;
    reset();
    ctx_.response = &response;
    ctx_.skip_body = skip_body_;
    return execute(data);
}

std::pair<ParseResult, size_t> Parser::execute(std::span<const uint8_t> data) {
    llhttp_errno_t err =
        llhttp_execute(&parser_, reinterpret_cast<const char*>(data.data()), data.size());

    size_t consumed = data.size();

    // on_message_complete pauses the parser so pipelined bytes stay unconsumed
    if (err == HPE_PAUSED || err == HPE_PAUSED_UPGRADE) {
        const char* pos = llhttp_get_error_pos(&parser_);
        if (pos) {
            consumed = static_cast<size_t>(reinterpret_cast<const uint8_t*>(pos) - data.data());
        }
        return {ParseResult::Complete, consumed};
    }

    if (err != HPE_OK) {
        const char* pos = llhttp_get_error_pos(&parser_);
        if (pos) {
            consumed = static_cast<size_t>(reinterpret_cast<const uint8_t*>(pos) - data.data());
        }
        ctx_.error = err;
        return {ParseResult::Error, consumed};
    }

    if (ctx_.message_complete) {
        return {ParseResult::Complete, consumed};
    }

    return {ParseResult::Incomplete, consumed};
}

ParseResult Parser::finish() {
    if (ctx_.message_complete) {
        return ParseResult::Complete;
    }

    llhttp_errno_t err = llhttp_finish(&parser_);
    if (err != HPE_OK && err != HPE_PAUSED) {
        ctx_.error = err;
        return ParseResult::Error;
    }

    return ctx_.message_complete ? ParseResult::Complete : ParseResult::Incomplete;
}

void Parser::reset() {
    llhttp_init(&parser_, parser_type_, &settings_);
    parser_.data = &ctx_;
    ctx_ = Context{};
}

std::string_view Parser::error_message() const noexcept {
    if (ctx_.error == HPE_OK) {
        return "";
    }
    return llhttp_errno_name(ctx_.error);
}

llhttp_errno_t Parser::error_code() const noexcept {
    return ctx_.error;
}

// Callbacks

int Parser::on_message_begin(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = false;
    ctx->headers_complete = false;
    ctx->error = HPE_OK;
    if (ctx->request) {
        ctx->request->clear();
    } else if (ctx->response) {
        ctx->response->clear();
    }
    return 0;
}

int Parser::on_url(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    append_span(ctx->url_start, ctx->url_length, at, length);
    return 0;
}

int Parser::on_status(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->response) return 0;

    append_span(ctx->status_start, ctx->status_length, at, length);
    return 0;
}

int Parser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request && !ctx->response) return -1;

    if (!ctx->field_open) {
        ctx->field_start = nullptr;
        ctx->value_start = nullptr;
        ctx->value_length = 0;
        ctx->field_open = true;
    }
    append_span(ctx->field_start, ctx->field_length, at, length);
    return 0;
}

int Parser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request && !ctx->response) return -1;

    append_span(ctx->value_start, ctx->value_length, at, length);
    return 0;
}

int Parser::on_header_value_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request && !ctx->response) return -1;

    Header header{std::string_view(ctx->field_start, ctx->field_length),
                  ctx->value_start ? std::string_view(ctx->value_start, ctx->value_length)
                                   : std::string_view{}};

    if (ctx->request) {
        ctx->request->headers.push_back(header);
    } else {
        ctx->response->headers.push_back(header);
    }

    ctx->field_open = false;
    return 0;
}

int Parser::on_headers_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request && !ctx->response) return -1;

    ctx->headers_complete = true;
    Version version = version_from(parser->http_major, parser->http_minor);

    if (ctx->request) {
        Request& request = *ctx->request;
        uint8_t method = llhttp_get_method(parser);
        request.method = method_from(method);
        request.method_name = llhttp_method_name(static_cast<llhttp_method_t>(method));
        request.version = version;
        request.upgrade = llhttp_get_upgrade(parser) != 0;

        if (ctx->url_start) {
            request.uri = std::string_view(ctx->url_start, ctx->url_length);
        }
        size_t query_pos = request.uri.find('?');
        if (query_pos != std::string_view::npos) {
            request.path = request.uri.substr(0, query_pos);
            request.query = request.uri.substr(query_pos + 1);
        } else {
            request.path = request.uri;
            request.query = {};
        }
        return 0;
    }

    Response& response = *ctx->response;
    response.status = llhttp_get_status_code(parser);
    response.version = version;
    if (ctx->status_start) {
        response.reason_phrase = std::string_view(ctx->status_start, ctx->status_length);
    }

    // 1 tells llhttp the message has no body (response to HEAD)
    return ctx->skip_body ? 1 : 0;
}

int Parser::on_body(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    const auto* begin = reinterpret_cast<const uint8_t*>(at);

    if (ctx->request) {
        ctx->request->body_storage.insert(ctx->request->body_storage.end(), begin,
                                          begin + length);
    } else if (ctx->response) {
        ctx->response->body_storage.insert(ctx->response->body_storage.end(), begin,
                                           begin + length);
    } else {
        return -1;
    }
    return 0;
}

int Parser::on_message_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = true;

    if (ctx->request) {
        ctx->request->body = ctx->request->body_storage;
    } else if (ctx->response) {
        ctx->response->body = ctx->response->body_storage;
    }

    return HPE_PAUSED;
}

}  // namespace warden::http
