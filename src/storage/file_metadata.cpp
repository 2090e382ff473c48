#include "chatvault/storage/file_metadata.hpp"
#include "chatvault/storage/chunker.hpp"
#include "chatvault/crypto/hash.hpp"
#include "chatvault/crypto/random.hpp"
#include <algorithm>

namespace chatvault::storage {

using core::VaultError;
using core::VaultResult;

namespace {
    template<typename T>
    void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            out.reset();
            return;
        }
        out = it->template get<T>();
    }

    template<typename T>
    void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
        if (value) {
            j[key] = *value;
        }
    }
}

bool ChunkInfo::operator==(const ChunkInfo& other) const {
    return index == other.index &&
           remote_ref == other.remote_ref &&
           size == other.size &&
           hash == other.hash;
}

void to_json(nlohmann::json& j, const ChunkInfo& chunk) {
    j = nlohmann::json{
        {"index", chunk.index},
        {"remote_ref", chunk.remote_ref},
        {"size", chunk.size},
        {"hash", chunk.hash}
    };
}

void from_json(const nlohmann::json& j, ChunkInfo& chunk) {
    j.at("index").get_to(chunk.index);
    j.at("remote_ref").get_to(chunk.remote_ref);
    j.at("size").get_to(chunk.size);
    j.at("hash").get_to(chunk.hash);
}

void to_json(nlohmann::json& j, const FileMetadata& metadata) {
    j = nlohmann::json{
        {"version", metadata.version},
        {"id", metadata.id},
        {"name", metadata.name},
        {"size", metadata.size},
        {"hash", metadata.hash},
        {"chunks", metadata.chunks},
        {"encrypted", metadata.encrypted},
        {"compressed", metadata.compressed},
        {"created_at", metadata.created_at}
    };
    put_optional(j, "compression_ratio", metadata.compression_ratio);
    put_optional(j, "mime_type", metadata.mime_type);
    put_optional(j, "modified_at", metadata.modified_at);
    put_optional(j, "remote_ref", metadata.remote_ref);
    put_optional(j, "chunk_size", metadata.chunk_size);
}

void from_json(const nlohmann::json& j, FileMetadata& metadata) {
    // Records written before versioning carry no version field.
    metadata.version = j.value("version", METADATA_VERSION);
    j.at("id").get_to(metadata.id);
    j.at("name").get_to(metadata.name);
    j.at("size").get_to(metadata.size);
    j.at("hash").get_to(metadata.hash);
    j.at("chunks").get_to(metadata.chunks);
    j.at("encrypted").get_to(metadata.encrypted);
    j.at("compressed").get_to(metadata.compressed);
    j.at("created_at").get_to(metadata.created_at);
    get_optional(j, "compression_ratio", metadata.compression_ratio);
    get_optional(j, "mime_type", metadata.mime_type);
    get_optional(j, "modified_at", metadata.modified_at);
    get_optional(j, "remote_ref", metadata.remote_ref);
    get_optional(j, "chunk_size", metadata.chunk_size);
}

uint64_t FileMetadata::total_stored_size() const {
    uint64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size;
    }
    return total;
}

bool FileMetadata::is_complete() const {
    if (chunk_size && *chunk_size > 0 && chunks.size() != count_chunks(size, *chunk_size)) {
        return false;
    }
    if (size > 0 && chunks.empty()) {
        return false;
    }

    std::vector<uint32_t> indices;
    indices.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        indices.push_back(chunk.index);
    }
    std::sort(indices.begin(), indices.end());

    for (size_t i = 0; i < indices.size(); ++i) {
        if (indices[i] != i) {
            return false;
        }
    }
    return true;
}

void FileMetadata::sort_chunks() {
    std::sort(chunks.begin(), chunks.end(), [](const ChunkInfo& a, const ChunkInfo& b) {
        return a.index < b.index;
    });
}

std::string FileMetadata::to_json() const {
    nlohmann::json j = *this;
    return j.dump();
}

VaultResult FileMetadata::from_json(const std::string& text, FileMetadata& out) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return VaultResult(VaultError::INVALID_RECORD, "File metadata is not a JSON object");
    }

    try {
        FileMetadata metadata = j.get<FileMetadata>();
        if (metadata.version > METADATA_VERSION) {
            return VaultResult(VaultError::INVALID_RECORD,
                               "Unsupported file metadata version " + std::to_string(metadata.version));
        }
        out = std::move(metadata);
    } catch (const nlohmann::json::exception& e) {
        return VaultResult(VaultError::INVALID_RECORD, std::string("Invalid file metadata: ") + e.what());
    }

    return VaultResult();
}

std::string generate_file_id(const std::string& name, uint64_t size) {
    std::string seed = name + ":" + std::to_string(size) + ":" +
                       std::to_string(crypto::SecureRandom::generate_uint64());
    auto digest = crypto::hash_utils::sha256(
        std::span(reinterpret_cast<const uint8_t*>(seed.data()), seed.size()));
    return crypto::hash_utils::to_hex(digest).substr(0, 12);
}

}
