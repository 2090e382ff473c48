#include "chatvault/crypto/random.hpp"
#include "chatvault/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace chatvault::crypto {

std::atomic<bool> SecureRandom::initialized_{false};

bool SecureRandom::initialize() {
    if (initialized_.load()) {
        return true;
    }

    // sodium_init() is itself safe to race; it returns 1 when already initialized.
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }

    if (!initialized_.exchange(true)) {
        LOG_DEBUG("Cryptographic random number generator initialized");
    }
    return true;
}

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return CryptoResult(CryptoError::RANDOM_GENERATION_FAILED, "Random generator not initialized");
    }

    if (output.empty()) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer is empty");
    }

    randombytes_buf(output.data(), output.size());
    return CryptoResult();
}

SecureBytes SecureRandom::generate_bytes(size_t count) {
    SecureBytes result(count);
    auto crypto_result = generate_bytes(result.span());
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to generate random bytes: " + crypto_result.message);
    }
    return result;
}

Salt SecureRandom::generate_salt() {
    Salt salt;
    auto result = generate_bytes(std::span(salt));
    if (!result.success()) {
        throw std::runtime_error("Failed to generate salt: " + result.message);
    }
    return salt;
}

Nonce SecureRandom::generate_nonce() {
    Nonce nonce;
    auto result = generate_bytes(std::span(nonce));
    if (!result.success()) {
        throw std::runtime_error("Failed to generate nonce: " + result.message);
    }
    return nonce;
}

std::uint64_t SecureRandom::generate_uint64() {
    std::uint64_t value = 0;
    auto result = generate_bytes(std::span(reinterpret_cast<std::uint8_t*>(&value), sizeof(value)));
    if (!result.success()) {
        throw std::runtime_error("Failed to generate random value: " + result.message);
    }
    return value;
}

}
