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

// Warden Content Decoding - Header
// Decoders for Gzip/Deflate, Zstd and Brotli response bodies. The proxy never
// relays Content-Encoding, so encoded backend bodies are decoded before relay.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

// Forward declarations for compression library types
struct z_stream_s;
typedef struct z_stream_s z_stream;
struct ZSTD_DCtx_s;
typedef struct ZSTD_DCtx_s ZSTD_DCtx;

namespace warden::core {

/// Content encodings understood by the decoder
enum class CompressionEncoding : uint8_t { NONE = 0, GZIP = 1, DEFLATE = 2, ZSTD = 3, BROTLI = 4, UNKNOWN = 5 };

/// Convert encoding enum to its Content-Encoding token
[[nodiscard]] constexpr const char* encoding_to_string(CompressionEncoding encoding) noexcept {
    switch (encoding) {
        case CompressionEncoding::GZIP:
            return "gzip";
        case CompressionEncoding::DEFLATE:
            return "deflate";
        case CompressionEncoding::ZSTD:
            return "zstd";
        case CompressionEncoding::BROTLI:
            return "br";
        case CompressionEncoding::NONE:
            return "identity";
        default:
            return "";
    }
}

/// Case-insensitive string equality check for encoding names
[[nodiscard]] constexpr bool encoding_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        char ca = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] + 32) : a[i];
        char cb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] + 32) : b[i];
        if (ca != cb) {
            return false;
        }
    }
    return true;
}

/// Parse one Content-Encoding token
[[nodiscard]] constexpr CompressionEncoding encoding_from_string(
    std::string_view encoding) noexcept {
    if (encoding.empty() || encoding_equals(encoding, "identity")) {
        return CompressionEncoding::NONE;
    } else if (encoding_equals(encoding, "gzip") || encoding_equals(encoding, "x-gzip")) {
        return CompressionEncoding::GZIP;
    } else if (encoding_equals(encoding, "deflate")) {
        return CompressionEncoding::DEFLATE;
    } else if (encoding_equals(encoding, "zstd")) {
        return CompressionEncoding::ZSTD;
    } else if (encoding_equals(encoding, "br") || encoding_equals(encoding, "brotli")) {
        return CompressionEncoding::BROTLI;
    }
    return CompressionEncoding::UNKNOWN;
}

/// zlib inflate context for gzip and deflate bodies
class InflateContext {
public:
    /// gzip=true expects a gzip wrapper, false a zlib wrapper (raw deflate is retried)
    explicit InflateContext(bool gzip);
    ~InflateContext();

    InflateContext(const InflateContext&) = delete;
    InflateContext& operator=(const InflateContext&) = delete;
    InflateContext(InflateContext&&) = delete;
    InflateContext& operator=(InflateContext&&) = delete;

    /// Decompress a complete body. std::nullopt on corrupt input or when the
    /// output would exceed max_output bytes (`ec` tells which).
    [[nodiscard]] std::optional<std::vector<uint8_t>> decompress(std::span<const uint8_t> input,
                                                                 size_t max_output,
                                                                 std::error_code& ec);

private:
    [[nodiscard]] bool init(int window_bits);
    void end() noexcept;

    z_stream* stream_;
    bool gzip_;
    bool initialized_;
};

/// Zstandard decompression context
class ZstdDecompressContext {
public:
    ZstdDecompressContext();
    ~ZstdDecompressContext();

    ZstdDecompressContext(const ZstdDecompressContext&) = delete;
    ZstdDecompressContext& operator=(const ZstdDecompressContext&) = delete;
    ZstdDecompressContext(ZstdDecompressContext&&) = delete;
    ZstdDecompressContext& operator=(ZstdDecompressContext&&) = delete;

    [[nodiscard]] std::optional<std::vector<uint8_t>> decompress(std::span<const uint8_t> input,
                                                                 size_t max_output,
                                                                 std::error_code& ec);

private:
    ZSTD_DCtx* dstream_;
};

/// Brotli decompression (stateless wrapper around the streaming decoder)
class BrotliDecompressContext {
public:
    [[nodiscard]] std::optional<std::vector<uint8_t>> decompress(std::span<const uint8_t> input,
                                                                 size_t max_output,
                                                                 std::error_code& ec);
};

/// Undo every coding listed in a Content-Encoding value (applied in reverse order).
/// Sets `ec` to invalid_argument for unknown codings, illegal_byte_sequence for
/// corrupt data and value_too_large when max_output is exceeded.
[[nodiscard]] std::optional<std::vector<uint8_t>> decode_content(
    std::string_view content_encoding, std::span<const uint8_t> body, size_t max_output,
    std::error_code& ec);

}  // namespace warden::core
