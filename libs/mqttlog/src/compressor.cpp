// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/compressor.hpp"

#include <glog/logging.h>
#include <zstd.h>

#include <algorithm>
#include <cctype>

namespace mqttlog {

const char* to_string(CompressorType type) {
    switch (type) {
        case CompressorType::NONE: return "none";
        case CompressorType::ZSTD: return "zstd";
    }
    return "unknown";
}

std::optional<CompressorType> compressor_type_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "none") return CompressorType::NONE;
    if (lower == "zstd") return CompressorType::ZSTD;
    return std::nullopt;
}

// =============================================================================
// ZstdCompressor
// =============================================================================

ZstdCompressor::ZstdCompressor(int level)
    : level_(std::clamp(level, ZSTD_minCLevel(), ZSTD_maxCLevel())) {
    if (level_ != level) {
        LOG(WARNING) << "zstd level " << level << " out of range, using " << level_;
    }

    ctx_.reset(ZSTD_createCCtx());
    if (!ctx_) {
        LOG(ERROR) << "zstd: no compression context, payloads will be rejected";
        return;
    }

    ZSTD_CCtx_setParameter(ctx_.get(), ZSTD_c_compressionLevel, level_);
    ZSTD_CCtx_setParameter(ctx_.get(), ZSTD_c_checksumFlag, 1);
    ZSTD_CCtx_setParameter(ctx_.get(), ZSTD_c_contentSizeFlag, 1);
}

void ZstdCompressor::ContextDeleter::operator()(ZSTD_CCtx* ctx) const {
    ZSTD_freeCCtx(ctx);
}

bool ZstdCompressor::compress(std::vector<uint8_t>& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ctx_) {
        stats_.failures++;
        return false;
    }

    scratch_.resize(ZSTD_compressBound(payload.size()));
    size_t written = ZSTD_compress2(ctx_.get(), scratch_.data(), scratch_.size(),
                                    payload.data(), payload.size());
    if (ZSTD_isError(written)) {
        stats_.failures++;
        LOG_EVERY_N(WARNING, 100) << "zstd compression failed: " << ZSTD_getErrorName(written);
        return false;
    }

    stats_.payloads++;
    stats_.bytes_in += payload.size();
    stats_.bytes_out += written;

    payload.assign(scratch_.begin(), scratch_.begin() + static_cast<std::ptrdiff_t>(written));
    return true;
}

CompressionStats ZstdCompressor::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

// =============================================================================
// PassthroughCompressor
// =============================================================================

bool PassthroughCompressor::compress(std::vector<uint8_t>& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.payloads++;
    stats_.bytes_in += payload.size();
    stats_.bytes_out += payload.size();
    return true;
}

CompressionStats PassthroughCompressor::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::unique_ptr<Compressor> create_compressor(CompressorType type, int level) {
    switch (type) {
        case CompressorType::NONE:
            return std::make_unique<PassthroughCompressor>();
        case CompressorType::ZSTD: {
            auto zstd = std::make_unique<ZstdCompressor>(level);
            if (!zstd->ready()) {
                return nullptr;
            }
            return zstd;
        }
    }
    return nullptr;
}

}  // namespace mqttlog
