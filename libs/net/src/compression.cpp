// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/compression.hpp"

#include <glog/logging.h>
#include <zstd.h>

#include <algorithm>
#include <cctype>

namespace sigroute {

const char* to_string(Compression compression) {
    switch (compression) {
        case Compression::Zstd: return "zstd";
        case Compression::None: return "none";
    }
    return "unknown";
}

std::optional<Compression> compression_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "zstd") {
        return Compression::Zstd;
    } else if (lower.empty() || lower == "none" || lower == "identity") {
        return Compression::None;
    }

    return std::nullopt;
}

const char* content_encoding(Compression compression) {
    return compression == Compression::Zstd ? "zstd" : "";
}

ZstdCompressor::ZstdCompressor(int level)
    : level_(level), ctx_(ZSTD_createCCtx()) {
    if (!ctx_) {
        LOG(ERROR) << "Failed to create ZSTD compression context";
    }
}

ZstdCompressor::~ZstdCompressor() {
    if (ctx_) {
        ZSTD_freeCCtx(ctx_);
        ctx_ = nullptr;
    }
}

std::optional<std::string> ZstdCompressor::compress(const std::string& data) {
    if (!ctx_) {
        return std::nullopt;
    }

    std::string compressed(ZSTD_compressBound(data.size()), '\0');
    size_t result = ZSTD_compressCCtx(ctx_, compressed.data(), compressed.size(),
                                      data.data(), data.size(), level_);
    if (ZSTD_isError(result)) {
        LOG_EVERY_N(WARNING, 100) << "Compression failed: " << ZSTD_getErrorName(result);
        return std::nullopt;
    }

    compressed.resize(result);
    return compressed;
}

ZstdDecompressor::ZstdDecompressor()
    : ctx_(ZSTD_createDCtx()) {
    if (!ctx_) {
        LOG(ERROR) << "Failed to create ZSTD decompression context";
    }
}

ZstdDecompressor::~ZstdDecompressor() {
    if (ctx_) {
        ZSTD_freeDCtx(ctx_);
        ctx_ = nullptr;
    }
}

std::optional<std::string> ZstdDecompressor::decompress(const std::string& data,
                                                        size_t max_size) {
    if (!ctx_ || data.empty()) {
        return std::nullopt;
    }

    // Streaming decompression so frames without a content size still work
    // and oversized payloads are cut off at max_size.
    ZSTD_DCtx_reset(ctx_, ZSTD_reset_session_only);

    std::string out;
    std::string chunk(ZSTD_DStreamOutSize(), '\0');
    ZSTD_inBuffer input{data.data(), data.size(), 0};

    while (true) {
        ZSTD_outBuffer output{chunk.data(), chunk.size(), 0};
        size_t ret = ZSTD_decompressStream(ctx_, &output, &input);
        if (ZSTD_isError(ret)) {
            VLOG(1) << "Decompression failed: " << ZSTD_getErrorName(ret);
            return std::nullopt;
        }

        out.append(chunk.data(), output.pos);
        if (out.size() > max_size) {
            VLOG(1) << "Decompressed body exceeds " << max_size << " bytes";
            return std::nullopt;
        }

        if (ret == 0 && input.pos == input.size) {
            break;
        }
        if (input.pos == input.size && output.pos < output.size) {
            // Input exhausted in the middle of a frame
            return std::nullopt;
        }
    }

    return out;
}

std::unique_ptr<Compressor> create_compressor(Compression compression, int level) {
    switch (compression) {
        case Compression::Zstd:
            return std::make_unique<ZstdCompressor>(level);
        case Compression::None:
            return nullptr;
    }
    return nullptr;
}

std::unique_ptr<Decompressor> create_decompressor(Compression compression) {
    switch (compression) {
        case Compression::Zstd:
            return std::make_unique<ZstdDecompressor>();
        case Compression::None:
            return nullptr;
    }
    return nullptr;
}

}  // namespace sigroute
