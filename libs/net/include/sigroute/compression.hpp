// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file compression.hpp
/// @brief Content-Encoding support for OTLP/HTTP bodies
///
/// The OTLP/HTTP exporter compresses request bodies, the OTLP/HTTP receiver
/// decompresses them. Only zstd and identity are supported.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Forward declarations
struct ZSTD_CCtx_s;
typedef struct ZSTD_CCtx_s ZSTD_CCtx;
struct ZSTD_DCtx_s;
typedef struct ZSTD_DCtx_s ZSTD_DCtx;

namespace sigroute {

enum class Compression {
    None,
    Zstd
};

/// @return "none" or "zstd"
const char* to_string(Compression compression);

/// Parse a compression name (case-insensitive). "", "none" and "identity"
/// mean no compression.
std::optional<Compression> compression_from_string(const std::string& name);

/// Value for the Content-Encoding header, empty for Compression::None
const char* content_encoding(Compression compression);

/// Compressor bound to one thread at a time (owns a zstd context)
class Compressor {
public:
    virtual ~Compressor() = default;

    /// Compress a body
    /// @return Compressed data, nullopt if compression failed
    virtual std::optional<std::string> compress(const std::string& data) = 0;

    virtual Compression type() const = 0;
};

class Decompressor {
public:
    virtual ~Decompressor() = default;

    /// Decompress a body.
    /// @param max_size Upper bound on the decompressed size
    /// @return Decompressed data, nullopt if corrupt or larger than max_size
    virtual std::optional<std::string> decompress(const std::string& data, size_t max_size) = 0;

    virtual Compression type() const = 0;
};

class ZstdCompressor : public Compressor {
public:
    explicit ZstdCompressor(int level = 3);
    ~ZstdCompressor() override;

    ZstdCompressor(const ZstdCompressor&) = delete;
    ZstdCompressor& operator=(const ZstdCompressor&) = delete;

    std::optional<std::string> compress(const std::string& data) override;
    Compression type() const override { return Compression::Zstd; }

private:
    int level_;
    ZSTD_CCtx* ctx_ = nullptr;
};

class ZstdDecompressor : public Decompressor {
public:
    ZstdDecompressor();
    ~ZstdDecompressor() override;

    ZstdDecompressor(const ZstdDecompressor&) = delete;
    ZstdDecompressor& operator=(const ZstdDecompressor&) = delete;

    std::optional<std::string> decompress(const std::string& data, size_t max_size) override;
    Compression type() const override { return Compression::Zstd; }

private:
    ZSTD_DCtx* ctx_ = nullptr;
};

/// Factory; returns nullptr for Compression::None
std::unique_ptr<Compressor> create_compressor(Compression compression, int level = 3);
std::unique_ptr<Decompressor> create_decompressor(Compression compression);

}  // namespace sigroute
