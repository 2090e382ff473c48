#pragma once

#include "crypto_types.hpp"
#include <atomic>
#include <span>
#include <vector>

namespace chatvault::crypto {

class SecureRandom {
public:
    // Idempotent and thread-safe; every other member calls it on demand.
    static bool initialize();

    static CryptoResult generate_bytes(std::span<std::uint8_t> output);
    static SecureBytes generate_bytes(size_t count);

    static Salt generate_salt();
    static Nonce generate_nonce();

    static std::uint64_t generate_uint64();

private:
    static std::atomic<bool> initialized_;
};

}
