#pragma once

#include "chatvault/core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chatvault::storage {

constexpr uint64_t DEFAULT_CHUNK_SIZE = 100ULL * 1024 * 1024; // 100MB
constexpr uint64_t MAX_CHUNK_SIZE = 2000ULL * 1024 * 1024;    // transport limit with margin

struct Chunk {
    uint32_t index = 0;
    std::vector<uint8_t> data;
    std::string hash;
    uint64_t size = 0;

    Chunk() = default;
    Chunk(uint32_t chunk_index, std::vector<uint8_t> bytes);

    // Upload filename of this chunk, e.g. "0003.chunk".
    std::string filename() const;
};

uint64_t count_chunks(uint64_t file_size, uint64_t chunk_size = DEFAULT_CHUNK_SIZE);

core::VaultResult validate_chunk_size(uint64_t chunk_size);

/**
 * Lazy, sequential file splitter.
 *
 * Holds at most one chunk in memory. Not restartable: construct a new splitter
 * to read the file again.
 */
class ChunkSplitter {
public:
    ChunkSplitter(const std::filesystem::path& file_path, uint64_t chunk_size = DEFAULT_CHUNK_SIZE);

    core::VaultResult open();

    // Next chunk, or nullopt at end of file. A read failure also ends the
    // sequence and is reported by status().
    std::optional<Chunk> next();

    const core::VaultResult& status() const { return status_; }

    uint32_t chunks_read() const { return next_index_; }

private:
    std::filesystem::path file_path_;
    uint64_t chunk_size_;
    std::ifstream file_;
    uint32_t next_index_;
    bool finished_;
    core::VaultResult status_;
};

core::VaultResult read_chunk(const std::filesystem::path& file_path,
                             uint32_t index,
                             uint64_t chunk_size,
                             Chunk& out_chunk);

/**
 * Reassembles a file from chunks arriving in any order.
 *
 * The destination is sized to the declared total up front and each chunk is
 * written at index * chunk_size. Re-writing an index is a no-op.
 */
class ChunkWriter {
public:
    ChunkWriter(const std::filesystem::path& output_path,
                uint64_t total_size,
                uint64_t chunk_size = DEFAULT_CHUNK_SIZE);
    ~ChunkWriter();

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    core::VaultResult open();

    core::VaultResult write_chunk(const Chunk& chunk);

    bool is_complete(uint32_t expected_chunks) const;
    std::vector<uint32_t> missing_chunks(uint32_t expected_chunks) const;

    const std::set<uint32_t>& written_chunks() const { return written_chunks_; }

    // Flushes and closes the destination; further writes reopen it.
    core::VaultResult close();

    const std::filesystem::path& output_path() const { return output_path_; }

private:
    std::filesystem::path output_path_;
    uint64_t total_size_;
    uint64_t chunk_size_;
    std::fstream file_;
    std::set<uint32_t> written_chunks_;
};

/**
 * Cuts chunks out of a byte stream that arrives in arbitrary pieces.
 */
class ChunkBuffer {
public:
    explicit ChunkBuffer(uint64_t chunk_size = DEFAULT_CHUNK_SIZE);

    // Appends data and returns every chunk completed by it.
    std::vector<Chunk> write(const std::vector<uint8_t>& data);

    // Trailing partial chunk, if any bytes are buffered.
    std::optional<Chunk> flush();

    size_t buffered() const { return buffer_.size(); }

private:
    uint64_t chunk_size_;
    std::vector<uint8_t> buffer_;
    uint32_t index_;
};

}
