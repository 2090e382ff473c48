#pragma once

#include "chatvault/core/result.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace chatvault::storage {

constexpr int DEFAULT_COMPRESSION_LEVEL = 6;

// False for names whose last extension is an already-compressed format.
bool should_compress(const std::string& filename);

core::VaultResult compress(std::span<const uint8_t> data,
                           std::vector<uint8_t>& out,
                           int level = DEFAULT_COMPRESSION_LEVEL);

core::VaultResult decompress(std::span<const uint8_t> data, std::vector<uint8_t>& out);

uint64_t estimate_compressed_size(uint64_t size, const std::string& filename);

/**
 * Incremental DEFLATE compressor. Output of successive compress() calls plus
 * the final flush() forms one zlib stream.
 */
class StreamingCompressor {
public:
    explicit StreamingCompressor(int level = DEFAULT_COMPRESSION_LEVEL);
    ~StreamingCompressor();

    StreamingCompressor(const StreamingCompressor&) = delete;
    StreamingCompressor& operator=(const StreamingCompressor&) = delete;

    core::VaultResult compress(std::span<const uint8_t> data, std::vector<uint8_t>& out);
    core::VaultResult flush(std::vector<uint8_t>& out);

    uint64_t total_in() const { return total_in_; }
    uint64_t total_out() const { return total_out_; }

    // total_out / total_in, 1.0 before any input.
    double ratio() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    uint64_t total_in_;
    uint64_t total_out_;
    bool finished_;
};

class StreamingDecompressor {
public:
    StreamingDecompressor();
    ~StreamingDecompressor();

    StreamingDecompressor(const StreamingDecompressor&) = delete;
    StreamingDecompressor& operator=(const StreamingDecompressor&) = delete;

    core::VaultResult decompress(std::span<const uint8_t> data, std::vector<uint8_t>& out);

    bool finished() const { return finished_; }

    uint64_t total_in() const { return total_in_; }
    uint64_t total_out() const { return total_out_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    uint64_t total_in_;
    uint64_t total_out_;
    bool finished_;
};

}
