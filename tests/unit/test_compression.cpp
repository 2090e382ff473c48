#include <gtest/gtest.h>
#include "chatvault/storage/compression.hpp"
#include <string>

using namespace chatvault::storage;
using chatvault::core::VaultError;

namespace {
    std::vector<uint8_t> repetitive_text(size_t size) {
        const std::string line = "2024-01-01 12:00:00 INFO chunk stored successfully\n";
        std::vector<uint8_t> data;
        while (data.size() < size) {
            data.insert(data.end(), line.begin(), line.end());
        }
        data.resize(size);
        return data;
    }
}

TEST(CompressionTest, RoundTrip) {
    auto data = repetitive_text(64 * 1024);

    std::vector<uint8_t> packed;
    ASSERT_TRUE(compress(data, packed));
    EXPECT_LT(packed.size(), data.size() / 4);

    std::vector<uint8_t> unpacked;
    ASSERT_TRUE(decompress(packed, unpacked));
    EXPECT_EQ(unpacked, data);
}

TEST(CompressionTest, EmptyInput) {
    std::vector<uint8_t> packed;
    ASSERT_TRUE(compress(std::vector<uint8_t>{}, packed));
    EXPECT_FALSE(packed.empty());

    std::vector<uint8_t> unpacked{1, 2, 3};
    ASSERT_TRUE(decompress(packed, unpacked));
    EXPECT_TRUE(unpacked.empty());

    ASSERT_TRUE(decompress(std::vector<uint8_t>{}, unpacked));
    EXPECT_TRUE(unpacked.empty());
}

TEST(CompressionTest, RejectsLevelOutOfRange) {
    std::vector<uint8_t> packed;
    EXPECT_EQ(compress(repetitive_text(10), packed, 0).error, VaultError::INVALID_CONFIGURATION);
    EXPECT_EQ(compress(repetitive_text(10), packed, 10).error, VaultError::INVALID_CONFIGURATION);
    EXPECT_TRUE(compress(repetitive_text(10), packed, 9));
}

TEST(CompressionTest, CorruptInput) {
    std::vector<uint8_t> garbage = {0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66};
    std::vector<uint8_t> out;
    EXPECT_EQ(decompress(garbage, out).error, VaultError::CHUNK_CORRUPTION);

    std::vector<uint8_t> packed;
    ASSERT_TRUE(compress(repetitive_text(4096), packed));
    packed.resize(packed.size() / 2);
    EXPECT_EQ(decompress(packed, out).error, VaultError::CHUNK_CORRUPTION);
}

TEST(CompressionTest, ShouldCompress) {
    EXPECT_TRUE(should_compress("notes.txt"));
    EXPECT_TRUE(should_compress("dump.sql"));
    EXPECT_TRUE(should_compress("README"));
    EXPECT_TRUE(should_compress("backup.tar"));

    EXPECT_FALSE(should_compress("photo.jpg"));
    EXPECT_FALSE(should_compress("PHOTO.JPEG"));
    EXPECT_FALSE(should_compress("movie.mkv"));
    EXPECT_FALSE(should_compress("archive.tar.gz"));
    EXPECT_FALSE(should_compress("paper.pdf"));
}

TEST(CompressionTest, EstimateCompressedSize) {
    EXPECT_EQ(estimate_compressed_size(1000, "photo.png"), 1000u);
    EXPECT_EQ(estimate_compressed_size(1000, "server.log"), 200u);
    EXPECT_EQ(estimate_compressed_size(1000, "main.cpp"), 250u);
    EXPECT_EQ(estimate_compressed_size(1000, "disk.iso"), 600u);
    EXPECT_EQ(estimate_compressed_size(1000, "data.bin"), 500u);
}

TEST(StreamingCompressionTest, PiecesFormOneStream) {
    auto data = repetitive_text(200 * 1024);

    StreamingCompressor compressor;
    EXPECT_DOUBLE_EQ(compressor.ratio(), 1.0);

    std::vector<uint8_t> stream;
    const size_t piece = 30 * 1024;
    for (size_t offset = 0; offset < data.size(); offset += piece) {
        auto length = std::min(piece, data.size() - offset);
        std::vector<uint8_t> out;
        ASSERT_TRUE(compressor.compress(std::span(data).subspan(offset, length), out));
        stream.insert(stream.end(), out.begin(), out.end());
    }

    std::vector<uint8_t> tail;
    ASSERT_TRUE(compressor.flush(tail));
    stream.insert(stream.end(), tail.begin(), tail.end());

    EXPECT_EQ(compressor.total_in(), data.size());
    EXPECT_EQ(compressor.total_out(), stream.size());
    EXPECT_LT(compressor.ratio(), 0.25);

    std::vector<uint8_t> whole;
    ASSERT_TRUE(decompress(stream, whole));
    EXPECT_EQ(whole, data);

    StreamingDecompressor decompressor;
    std::vector<uint8_t> restored;
    for (size_t offset = 0; offset < stream.size(); offset += 1000) {
        auto length = std::min<size_t>(1000, stream.size() - offset);
        std::vector<uint8_t> out;
        ASSERT_TRUE(decompressor.decompress(std::span(stream).subspan(offset, length), out));
        restored.insert(restored.end(), out.begin(), out.end());
    }
    EXPECT_TRUE(decompressor.finished());
    EXPECT_EQ(restored, data);
}
