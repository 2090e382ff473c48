#pragma once

#include "crypto_types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace chatvault::crypto {

// Incremental BLAKE2b-256 content digest (libsodium crypto_generichash).
class Blake2bHasher {
public:
    Blake2bHasher();
    ~Blake2bHasher();

    Blake2bHasher(const Blake2bHasher&) = delete;
    Blake2bHasher& operator=(const Blake2bHasher&) = delete;

    CryptoResult initialize();
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(std::span<std::uint8_t> output);
    Digest finalize();

    static Digest hash(std::span<const std::uint8_t> data);
    static CryptoResult hash_file(const std::filesystem::path& file_path, Digest& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes);
std::optional<Digest> digest_from_hex(const std::string& hex_string);

// Hex digest of a byte range, the form stored in Chunk/ChunkInfo records.
std::string digest_hex(std::span<const std::uint8_t> data);

// Hex digest of a whole file; nullopt when the file cannot be read.
std::optional<std::string> file_digest_hex(const std::filesystem::path& file_path);

Sha256Digest sha256(std::span<const std::uint8_t> data);

}

}
