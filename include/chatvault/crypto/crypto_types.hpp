#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace chatvault::crypto {

// Argon2id salt, matches crypto_pwhash_SALTBYTES
constexpr size_t SALT_SIZE = 16;

// ChaCha20-Poly1305 (IETF) parameters
constexpr size_t KEY_SIZE = 32;
constexpr size_t NONCE_SIZE = 12;
constexpr size_t TAG_SIZE = 16;

// salt || nonce prefix of every per-chunk ciphertext
constexpr size_t HEADER_SIZE = SALT_SIZE + NONCE_SIZE;
constexpr size_t MIN_CIPHERTEXT_SIZE = HEADER_SIZE + TAG_SIZE;

constexpr size_t DIGEST_SIZE = 32;
constexpr size_t SHA256_SIZE = 32;

using Salt = std::array<std::uint8_t, SALT_SIZE>;
using Nonce = std::array<std::uint8_t, NONCE_SIZE>;
using Digest = std::array<std::uint8_t, DIGEST_SIZE>;
using Sha256Digest = std::array<std::uint8_t, SHA256_SIZE>;

// Secure memory utilities
struct SecureBytes {
    std::vector<std::uint8_t> data;

    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    SecureBytes(std::span<const std::uint8_t> bytes);

    ~SecureBytes();

    // Disable copy to prevent key material leakage
    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;

    std::uint8_t* data_ptr() { return data.data(); }
    const std::uint8_t* data_ptr() const { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

    std::span<std::uint8_t> span() { return std::span(data); }
    std::span<const std::uint8_t> span() const { return std::span(data); }

    void clear();
    void resize(size_t new_size);
};

enum class CryptoError {
    SUCCESS = 0,
    INVALID_KEY,
    ENCRYPTION_FAILED,
    DECRYPTION_FAILED,
    KEY_DERIVATION_FAILED,
    INVALID_FORMAT,
    BUFFER_TOO_SMALL,
    RANDOM_GENERATION_FAILED,
    LIMIT_EXCEEDED,
    INVALID_STATE
};

struct CryptoResult {
    CryptoError error;
    std::string message;

    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
