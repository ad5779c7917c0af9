// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file compressor.hpp
/// @brief Payload compression for forwarding pipelines
///
/// Applied to each encoded payload on the submitting thread, before the
/// message is queued. Every zstd payload is a single self-contained frame
/// carrying its content size and a checksum, so a receiver only needs to
/// know the pipeline's compression setting to decode it.

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct ZSTD_CCtx_s;

namespace mqttlog {

/// Payload compression algorithms
enum class CompressorType : uint8_t {
    NONE,   ///< Payload sent as encoded
    ZSTD    ///< One zstd frame per payload
};

/// "none" or "zstd"
const char* to_string(CompressorType type);

/// Parse CompressorType from string (case-insensitive)
std::optional<CompressorType> compressor_type_from_string(const std::string& name);

/// Compression statistics
struct CompressionStats {
    uint64_t payloads = 0;   ///< Payloads compressed successfully
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
    uint64_t failures = 0;

    /// Output size relative to input (0.0 when nothing was compressed)
    double ratio() const {
        return bytes_in > 0 ? static_cast<double>(bytes_out) / bytes_in : 0.0;
    }
};

/// Compresses payloads in place. Safe to call from many producer threads.
class Compressor {
public:
    virtual ~Compressor() = default;

    /// Replace payload with its compressed form
    /// @return false if compression failed; payload is left unchanged
    virtual bool compress(std::vector<uint8_t>& payload) = 0;

    virtual CompressionStats stats() const = 0;
    virtual CompressorType type() const = 0;

    const char* name() const { return to_string(type()); }
};

/// zstd compressor sharing one compression context between callers
class ZstdCompressor : public Compressor {
public:
    /// @param level zstd level, clamped to the range the library supports
    explicit ZstdCompressor(int level = 3);

    /// False if the compression context could not be created
    bool ready() const { return ctx_ != nullptr; }
    int level() const { return level_; }

    bool compress(std::vector<uint8_t>& payload) override;
    CompressionStats stats() const override;
    CompressorType type() const override { return CompressorType::ZSTD; }

private:
    struct ContextDeleter {
        void operator()(ZSTD_CCtx_s* ctx) const;
    };

    int level_;
    std::unique_ptr<ZSTD_CCtx_s, ContextDeleter> ctx_;
    std::vector<uint8_t> scratch_;

    mutable std::mutex mutex_;
    CompressionStats stats_;
};

/// Leaves payloads untouched, only counts them
class PassthroughCompressor : public Compressor {
public:
    bool compress(std::vector<uint8_t>& payload) override;
    CompressionStats stats() const override;
    CompressorType type() const override { return CompressorType::NONE; }

private:
    mutable std::mutex mutex_;
    CompressionStats stats_;
};

/// Create a compressor for a pipeline
/// @return nullptr if the compressor could not be set up
std::unique_ptr<Compressor> create_compressor(CompressorType type, int level = 3);

}  // namespace mqttlog
