// test_chunk_compressor.cpp — Тесты сжатия chunk'ов

#include <gtest/gtest.h>
#include "innerocket/Transfer/ChunkCompressor.h"
#include <string>

using namespace Innerocket;

namespace {

std::vector<uint8_t> textData(size_t size) {
    static const std::string line = "The quick brown fox jumps over the lazy dog. ";
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(line[i % line.size()]);
    }
    return data;
}

std::vector<uint8_t> noise(size_t size) {
    std::vector<uint8_t> data(size);
    uint32_t state = 99;
    for (auto& b : data) {
        state = state * 1103515245u + 12345u;
        b = static_cast<uint8_t>(state >> 16);
    }
    return data;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// shouldCompress
// ═══════════════════════════════════════════════════════════

TEST(ChunkCompressorTest, TextTypesAreCompressed) {
    TransferConfig config;
    EXPECT_TRUE(ChunkCompressor::shouldCompress("notes.txt", "text/plain", 4096, config));
    EXPECT_TRUE(ChunkCompressor::shouldCompress("data.json", "application/json", 4096, config));
    EXPECT_TRUE(ChunkCompressor::shouldCompress("table.csv", "TEXT/CSV", 4096, config));
    EXPECT_TRUE(ChunkCompressor::shouldCompress("README", "text/markdown", 4096, config));
}

TEST(ChunkCompressorTest, BinaryAndPackedTypesAreNot) {
    TransferConfig config;
    EXPECT_FALSE(ChunkCompressor::shouldCompress("movie.mp4", "video/mp4", 4096, config));
    EXPECT_FALSE(ChunkCompressor::shouldCompress("blob.bin", "application/octet-stream", 4096, config));
    // Extension wins over a text MIME type
    EXPECT_FALSE(ChunkCompressor::shouldCompress("logs.ZIP", "text/plain", 4096, config));
    EXPECT_FALSE(ChunkCompressor::shouldCompress("page.pdf", "text/html", 4096, config));
}

TEST(ChunkCompressorTest, SmallFilesOrDisabledAreNot) {
    TransferConfig config;
    EXPECT_FALSE(ChunkCompressor::shouldCompress("tiny.txt", "text/plain", 1023, config));

    config.enableCompression = false;
    EXPECT_FALSE(ChunkCompressor::shouldCompress("notes.txt", "text/plain", 4096, config));
}

TEST(ChunkCompressorTest, LevelFollowsConnectionQuality) {
    EXPECT_EQ(ChunkCompressor::levelFor(ConnectionQuality::Slow), 3);
    EXPECT_EQ(ChunkCompressor::levelFor(ConnectionQuality::Medium), 6);
    EXPECT_EQ(ChunkCompressor::levelFor(ConnectionQuality::Fast), 9);
}

// ═══════════════════════════════════════════════════════════
// compress / decompress
// ═══════════════════════════════════════════════════════════

TEST(ChunkCompressorTest, TextShrinksAndInflatesBack) {
    TransferConfig config;
    auto data = textData(64 * 1024);

    auto packed = ChunkCompressor::compress(data, 6, config);
    ASSERT_TRUE(packed.has_value());
    EXPECT_LT(packed->size(), data.size() / 10);

    auto plain = ChunkCompressor::decompress(packed->data(), packed->size(), data.size());
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, data);
}

TEST(ChunkCompressorTest, IncompressibleDataIsLeftAlone) {
    TransferConfig config;
    EXPECT_FALSE(ChunkCompressor::compress(noise(64 * 1024), 9, config).has_value());
}

TEST(ChunkCompressorTest, ChunkBelowThresholdIsLeftAlone) {
    TransferConfig config;
    EXPECT_FALSE(ChunkCompressor::compress(textData(512), 6, config).has_value());

    config.compressionMinSize = 256;
    EXPECT_TRUE(ChunkCompressor::compress(textData(512), 6, config).has_value());
}

TEST(ChunkCompressorTest, RatioLimitSkipsWeakCompression) {
    TransferConfig config;
    auto data = textData(64 * 1024);
    config.maxCompressionRatio = 0.0001;
    EXPECT_FALSE(ChunkCompressor::compress(data, 9, config).has_value());
}

TEST(ChunkCompressorTest, DecompressRejectsWrongLengthOrGarbage) {
    TransferConfig config;
    auto data = textData(8192);
    auto packed = ChunkCompressor::compress(data, 6, config);
    ASSERT_TRUE(packed.has_value());

    EXPECT_FALSE(ChunkCompressor::decompress(packed->data(), packed->size(), data.size() - 1).has_value());
    EXPECT_FALSE(ChunkCompressor::decompress(packed->data(), packed->size(), data.size() + 1).has_value());

    auto garbage = noise(256);
    EXPECT_FALSE(ChunkCompressor::decompress(garbage.data(), garbage.size(), 8192).has_value());
    EXPECT_FALSE(ChunkCompressor::decompress(nullptr, 0, 10).has_value());
}

TEST(ChunkCompressorTest, SavingsArePercentOfCompressedChunks) {
    auto s = ChunkCompressor::savings(3000, 1000);
    EXPECT_EQ(s.savedBytes, 2000);
    EXPECT_DOUBLE_EQ(s.savedPercentage, 66.67);

    auto none = ChunkCompressor::savings(0, 0);
    EXPECT_EQ(none.savedBytes, 0);
    EXPECT_DOUBLE_EQ(none.savedPercentage, 0.0);
}
