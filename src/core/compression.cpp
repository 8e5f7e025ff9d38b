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

// Warden Content Decoding - Implementation

#include "compression.hpp"

#include <brotli/decode.h>
#include <zlib.h>
#include <zstd.h>

#include <algorithm>
#include <string>

namespace warden::core {

namespace {

constexpr size_t kChunkSize = 16 * 1024;

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

}  // namespace

// ============================================================================
// InflateContext Implementation
// ============================================================================

InflateContext::InflateContext(bool gzip)
    : stream_(new z_stream{}), gzip_(gzip), initialized_(false) {
    // windowBits=15+32: accept both gzip and zlib headers
    initialized_ = init(15 + 32);
}

InflateContext::~InflateContext() {
    end();
    delete stream_;
}

bool InflateContext::init(int window_bits) {
    stream_->zalloc = Z_NULL;
    stream_->zfree = Z_NULL;
    stream_->opaque = Z_NULL;
    stream_->next_in = Z_NULL;
    stream_->avail_in = 0;
    return inflateInit2(stream_, window_bits) == Z_OK;
}

void InflateContext::end() noexcept {
    if (initialized_) {
        inflateEnd(stream_);
        initialized_ = false;
    }
}

std::optional<std::vector<uint8_t>> InflateContext::decompress(std::span<const uint8_t> input,
                                                               size_t max_output,
                                                               std::error_code& ec) {
    if (!initialized_) {
        ec = std::make_error_code(std::errc::not_enough_memory);
        return std::nullopt;
    }

    auto run = [&](std::vector<uint8_t>& output) -> int {
        inflateReset(stream_);
        stream_->next_in = const_cast<Bytef*>(input.data());
        stream_->avail_in = static_cast<uInt>(input.size());

        int ret = Z_OK;
        while (ret != Z_STREAM_END) {
            size_t offset = output.size();
            output.resize(offset + kChunkSize);
            stream_->next_out = output.data() + offset;
            stream_->avail_out = static_cast<uInt>(kChunkSize);

            ret = inflate(stream_, Z_NO_FLUSH);
            output.resize(offset + (kChunkSize - stream_->avail_out));

            if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR) {
                return Z_DATA_ERROR;
            }
            if (output.size() > max_output) {
                return Z_BUF_ERROR;
            }
            // Truncated stream: no progress and no input left
            if (ret == Z_BUF_ERROR || (ret == Z_OK && stream_->avail_in == 0 &&
                                       stream_->avail_out != 0)) {
                return Z_DATA_ERROR;
            }
        }
        return Z_STREAM_END;
    };

    std::vector<uint8_t> output;
    output.reserve(std::min(max_output, input.size() * 4 + kChunkSize));
    int ret = run(output);

    // Some servers send raw deflate for "deflate"
    if (ret == Z_DATA_ERROR && !gzip_) {
        end();
        initialized_ = init(-15);
        if (initialized_) {
            output.clear();
            ret = run(output);
        }
        end();
        initialized_ = init(15 + 32);
    }

    if (ret == Z_BUF_ERROR) {
        ec = std::make_error_code(std::errc::value_too_large);
        return std::nullopt;
    }
    if (ret != Z_STREAM_END) {
        ec = std::make_error_code(std::errc::illegal_byte_sequence);
        return std::nullopt;
    }
    return output;
}

// ============================================================================
// ZstdDecompressContext Implementation
// ============================================================================

ZstdDecompressContext::ZstdDecompressContext() : dstream_(ZSTD_createDCtx()) {}

ZstdDecompressContext::~ZstdDecompressContext() {
    if (dstream_) {
        ZSTD_freeDCtx(dstream_);
    }
}

std::optional<std::vector<uint8_t>> ZstdDecompressContext::decompress(
    std::span<const uint8_t> input, size_t max_output, std::error_code& ec) {
    if (!dstream_) {
        ec = std::make_error_code(std::errc::not_enough_memory);
        return std::nullopt;
    }

    ZSTD_DCtx_reset(dstream_, ZSTD_reset_session_only);

    ZSTD_inBuffer in = {input.data(), input.size(), 0};
    std::vector<uint8_t> output;
    size_t ret = 1;

    while (in.pos < in.size || ret != 0) {
        size_t offset = output.size();
        output.resize(offset + kChunkSize);
        ZSTD_outBuffer out = {output.data() + offset, kChunkSize, 0};

        ret = ZSTD_decompressStream(dstream_, &out, &in);
        output.resize(offset + out.pos);

        if (ZSTD_isError(ret)) {
            ec = std::make_error_code(std::errc::illegal_byte_sequence);
            return std::nullopt;
        }
        if (output.size() > max_output) {
            ec = std::make_error_code(std::errc::value_too_large);
            return std::nullopt;
        }
        // Frame incomplete and nothing more to feed
        if (ret != 0 && in.pos == in.size && out.pos < kChunkSize) {
            ec = std::make_error_code(std::errc::illegal_byte_sequence);
            return std::nullopt;
        }
    }

    return output;
}

// ============================================================================
// BrotliDecompressContext Implementation
// ============================================================================

std::optional<std::vector<uint8_t>> BrotliDecompressContext::decompress(
    std::span<const uint8_t> input, size_t max_output, std::error_code& ec) {
    BrotliDecoderState* state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
    if (!state) {
        ec = std::make_error_code(std::errc::not_enough_memory);
        return std::nullopt;
    }

    const uint8_t* next_in = input.data();
    size_t avail_in = input.size();
    std::vector<uint8_t> output;
    BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;

    while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
        size_t offset = output.size();
        output.resize(offset + kChunkSize);
        uint8_t* next_out = output.data() + offset;
        size_t avail_out = kChunkSize;

        result = BrotliDecoderDecompressStream(state, &avail_in, &next_in, &avail_out, &next_out,
                                               nullptr);
        output.resize(offset + (kChunkSize - avail_out));

        if (output.size() > max_output) {
            BrotliDecoderDestroyInstance(state);
            ec = std::make_error_code(std::errc::value_too_large);
            return std::nullopt;
        }
    }

    BrotliDecoderDestroyInstance(state);

    // Bytes after the final meta-block are not part of the stream
    if (result != BROTLI_DECODER_RESULT_SUCCESS || avail_in != 0) {
        ec = std::make_error_code(std::errc::illegal_byte_sequence);
        return std::nullopt;
    }
    return output;
}

// ============================================================================
// decode_content
// ============================================================================

std::optional<std::vector<uint8_t>> decode_content(std::string_view content_encoding,
                                                   std::span<const uint8_t> body,
                                                   size_t max_output, std::error_code& ec) {
    ec.clear();

    std::vector<CompressionEncoding> codings;
    size_t pos = 0;
    while (pos <= content_encoding.size()) {
        size_t comma = content_encoding.find(',', pos);
        if (comma == std::string_view::npos) comma = content_encoding.size();
        auto token = trim(content_encoding.substr(pos, comma - pos));
        auto coding = encoding_from_string(token);
        if (coding == CompressionEncoding::UNKNOWN) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return std::nullopt;
        }
        if (coding != CompressionEncoding::NONE) {
            codings.push_back(coding);
        }
        pos = comma + 1;
    }

    std::vector<uint8_t> current(body.begin(), body.end());

    // Codings are listed in the order they were applied
    for (auto it = codings.rbegin(); it != codings.rend(); ++it) {
        std::optional<std::vector<uint8_t>> decoded;
        switch (*it) {
            case CompressionEncoding::GZIP: {
                InflateContext ctx(true);
                decoded = ctx.decompress(current, max_output, ec);
                break;
            }
            case CompressionEncoding::DEFLATE: {
                InflateContext ctx(false);
                decoded = ctx.decompress(current, max_output, ec);
                break;
            }
            case CompressionEncoding::ZSTD: {
                ZstdDecompressContext ctx;
                decoded = ctx.decompress(current, max_output, ec);
                break;
            }
            case CompressionEncoding::BROTLI: {
                BrotliDecompressContext ctx;
                decoded = ctx.decompress(current, max_output, ec);
                break;
            }
            default:
                break;
        }
        if (!decoded) {
            return std::nullopt;
        }
        current = std::move(*decoded);
    }

    return current;
}

}  // namespace warden::core
