#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/remote/message.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chatvault::storage {

constexpr int METADATA_VERSION = 1;

struct ChunkInfo {
    uint32_t index = 0;
    remote::MessageRef remote_ref = 0;
    // Stored bytes, i.e. after compression and encryption.
    uint64_t size = 0;
    // Digest of the stored bytes, checked before decoding.
    std::string hash;

    bool operator==(const ChunkInfo& other) const;
};

struct FileMetadata {
    int version = METADATA_VERSION;
    std::string id;
    std::string name;
    uint64_t size = 0;
    std::string hash;
    std::vector<ChunkInfo> chunks;
    bool encrypted = false;
    bool compressed = false;
    std::optional<double> compression_ratio;
    std::optional<std::string> mime_type;
    double created_at = 0.0;
    std::optional<double> modified_at;
    std::optional<remote::MessageRef> remote_ref;
    std::optional<uint64_t> chunk_size;

    size_t chunk_count() const { return chunks.size(); }
    uint64_t total_stored_size() const;

    // Chunk indices are exactly 0..n-1 and, when the chunk size is recorded,
    // n matches the plaintext size.
    bool is_complete() const;

    void sort_chunks();

    std::string to_json() const;
    static core::VaultResult from_json(const std::string& text, FileMetadata& out);
};

// Generates a short file identifier: the first 12 hex chars of
// SHA-256("<name>:<size>:<random>").
std::string generate_file_id(const std::string& name, uint64_t size);

void to_json(nlohmann::json& j, const ChunkInfo& chunk);
void from_json(const nlohmann::json& j, ChunkInfo& chunk);

void to_json(nlohmann::json& j, const FileMetadata& metadata);
void from_json(const nlohmann::json& j, FileMetadata& metadata);

}
