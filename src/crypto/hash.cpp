#include "chatvault/crypto/hash.hpp"
#include "chatvault/crypto/random.hpp"
#include <sodium.h>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace chatvault::crypto {

struct Blake2bHasher::Impl {
    crypto_generichash_state state;
};

Blake2bHasher::Blake2bHasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Blake2bHasher::~Blake2bHasher() {
    sodium_memzero(&impl_->state, sizeof(impl_->state));
}

CryptoResult Blake2bHasher::initialize() {
    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::INVALID_STATE, "libsodium is not available");
    }

    if (crypto_generichash_init(&impl_->state, nullptr, 0, DIGEST_SIZE) != 0) {
        return CryptoResult(CryptoError::INVALID_STATE, "Failed to initialize hasher");
    }

    initialized_ = true;
    return CryptoResult();
}

CryptoResult Blake2bHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }

    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return CryptoResult(CryptoError::INVALID_STATE, "Failed to update hash");
    }

    return CryptoResult();
}

CryptoResult Blake2bHasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }

    if (output.size() < DIGEST_SIZE) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer too small");
    }

    if (crypto_generichash_final(&impl_->state, output.data(), DIGEST_SIZE) != 0) {
        return CryptoResult(CryptoError::INVALID_STATE, "Failed to finalize hash");
    }

    initialized_ = false; // Hasher is consumed
    return CryptoResult();
}

Digest Blake2bHasher::finalize() {
    Digest result;
    auto crypto_result = finalize(std::span(result));
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to finalize hash: " + crypto_result.message);
    }
    return result;
}

Digest Blake2bHasher::hash(std::span<const std::uint8_t> data) {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("libsodium is not available");
    }

    Digest result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

CryptoResult Blake2bHasher::hash_file(const std::filesystem::path& file_path, Digest& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return CryptoResult(CryptoError::INVALID_STATE, "Cannot open file for hashing: " + file_path.string());
    }

    Blake2bHasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }

    constexpr size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());

        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }

    if (file.bad()) {
        return CryptoResult(CryptoError::INVALID_STATE, "Read error while hashing: " + file_path.string());
    }

    return hasher.finalize(std::span(output));
}

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

std::optional<Digest> digest_from_hex(const std::string& hex_string) {
    if (hex_string.length() != DIGEST_SIZE * 2) {
        return std::nullopt;
    }

    Digest digest;
    size_t decoded = 0;
    if (sodium_hex2bin(digest.data(), digest.size(), hex_string.data(), hex_string.size(),
                       nullptr, &decoded, nullptr) != 0 || decoded != DIGEST_SIZE) {
        return std::nullopt;
    }

    return digest;
}

std::string digest_hex(std::span<const std::uint8_t> data) {
    auto digest = Blake2bHasher::hash(data);
    return to_hex(digest);
}

std::optional<std::string> file_digest_hex(const std::filesystem::path& file_path) {
    Digest digest;
    if (!Blake2bHasher::hash_file(file_path, digest)) {
        return std::nullopt;
    }
    return to_hex(digest);
}

Sha256Digest sha256(std::span<const std::uint8_t> data) {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("libsodium is not available");
    }

    Sha256Digest result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

}

}
