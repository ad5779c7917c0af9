// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/compressor.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>

namespace mqttlog::test {

namespace {

// JSON log line repeated, compresses well
std::vector<uint8_t> log_lines(size_t copies) {
    const std::string line =
        "{\"level\":\"INFO\",\"logger\":\"vehicle.gateway\",\"message\":\"heartbeat\"}\n";
    std::vector<uint8_t> data;
    for (size_t i = 0; i < copies; ++i) {
        data.insert(data.end(), line.begin(), line.end());
    }
    return data;
}

bool is_zstd_frame(const std::vector<uint8_t>& data) {
    // magic 0xFD2FB528, little endian
    return data.size() >= 4 && data[0] == 0x28 && data[1] == 0xB5 &&
           data[2] == 0x2F && data[3] == 0xFD;
}

}  // namespace

TEST(CompressorTypeTest, Names) {
    EXPECT_STREQ(to_string(CompressorType::ZSTD), "zstd");
    EXPECT_STREQ(to_string(CompressorType::NONE), "none");
    EXPECT_EQ(compressor_type_from_string("Zstd"), CompressorType::ZSTD);
    EXPECT_EQ(compressor_type_from_string("NONE"), CompressorType::NONE);
    EXPECT_FALSE(compressor_type_from_string("gzip").has_value());
    EXPECT_FALSE(compressor_type_from_string("").has_value());
}

// =============================================================================
// ZstdCompressor
// =============================================================================

TEST(ZstdCompressorTest, ReplacesPayloadWithFrame) {
    ZstdCompressor compressor;
    ASSERT_TRUE(compressor.ready());

    auto payload = log_lines(1);
    ASSERT_TRUE(compressor.compress(payload));
    EXPECT_TRUE(is_zstd_frame(payload));
}

TEST(ZstdCompressorTest, ShrinksRepetitivePayload) {
    for (int level : {1, 3, 9}) {
        ZstdCompressor compressor(level);
        auto payload = log_lines(100);
        size_t original = payload.size();
        ASSERT_TRUE(compressor.compress(payload)) << "level " << level;
        EXPECT_LT(payload.size(), original / 4) << "level " << level;
    }
}

TEST(ZstdCompressorTest, EmptyPayloadStillFramed) {
    ZstdCompressor compressor;
    std::vector<uint8_t> payload;
    ASSERT_TRUE(compressor.compress(payload));
    EXPECT_TRUE(is_zstd_frame(payload));
}

TEST(ZstdCompressorTest, LevelClamped) {
    ZstdCompressor high(1000);
    EXPECT_LT(high.level(), 1000);
    EXPECT_TRUE(high.ready());

    ZstdCompressor normal(5);
    EXPECT_EQ(normal.level(), 5);
}

TEST(ZstdCompressorTest, SameInputSameOutput) {
    ZstdCompressor compressor;
    auto first = log_lines(10);
    auto second = log_lines(10);
    ASSERT_TRUE(compressor.compress(first));
    ASSERT_TRUE(compressor.compress(second));
    EXPECT_EQ(first, second);
}

TEST(ZstdCompressorTest, Stats) {
    ZstdCompressor compressor;
    auto payload = log_lines(20);
    size_t original = payload.size();

    auto a = payload;
    auto b = payload;
    ASSERT_TRUE(compressor.compress(a));
    ASSERT_TRUE(compressor.compress(b));

    auto stats = compressor.stats();
    EXPECT_EQ(stats.payloads, 2u);
    EXPECT_EQ(stats.bytes_in, 2 * original);
    EXPECT_EQ(stats.bytes_out, a.size() + b.size());
    EXPECT_EQ(stats.failures, 0u);
    EXPECT_LT(stats.ratio(), 1.0);
}

TEST(ZstdCompressorTest, ConcurrentProducers) {
    ZstdCompressor compressor;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&compressor] {
            for (int i = 0; i < kPerThread; ++i) {
                auto payload = log_lines(5);
                EXPECT_TRUE(compressor.compress(payload));
                EXPECT_TRUE(is_zstd_frame(payload));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(compressor.stats().payloads, static_cast<uint64_t>(kThreads * kPerThread));
}

// =============================================================================
// PassthroughCompressor and factory
// =============================================================================

TEST(PassthroughCompressorTest, LeavesPayloadUntouched) {
    PassthroughCompressor compressor;
    auto payload = log_lines(2);
    auto original = payload;

    ASSERT_TRUE(compressor.compress(payload));
    EXPECT_EQ(payload, original);
    EXPECT_EQ(compressor.stats().payloads, 1u);
    EXPECT_DOUBLE_EQ(compressor.stats().ratio(), 1.0);
}

TEST(CreateCompressorTest, ByType) {
    auto zstd = create_compressor(CompressorType::ZSTD, 5);
    ASSERT_NE(zstd, nullptr);
    EXPECT_EQ(zstd->type(), CompressorType::ZSTD);
    EXPECT_STREQ(zstd->name(), "zstd");

    auto none = create_compressor(CompressorType::NONE);
    ASSERT_NE(none, nullptr);
    EXPECT_EQ(none->type(), CompressorType::NONE);
    EXPECT_STREQ(none->name(), "none");
}

TEST(CompressionStatsTest, RatioWithoutData) {
    CompressionStats stats;
    EXPECT_DOUBLE_EQ(stats.ratio(), 0.0);
}

}  // namespace mqttlog::test
