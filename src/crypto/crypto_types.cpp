#include "chatvault/crypto/crypto_types.hpp"
#include <algorithm>
#include <cstring>

#include <sodium.h>

namespace chatvault::crypto {

SecureBytes::SecureBytes(size_t size) : data(size) {
    sodium_memzero(data.data(), data.size());
}

SecureBytes::SecureBytes(std::span<const std::uint8_t> bytes)
    : data(bytes.begin(), bytes.end()) {}

SecureBytes::~SecureBytes() {
    clear();
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept
    : data(std::move(other.data)) {
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data = std::move(other.data);
    }
    return *this;
}

void SecureBytes::clear() {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
        data.clear();
    }
}

void SecureBytes::resize(size_t new_size) {
    if (new_size < data.size()) {
        sodium_memzero(data.data() + new_size, data.size() - new_size);
        data.resize(new_size);
        return;
    }

    // Grow through a fresh buffer so the old allocation is wiped, not just released.
    std::vector<std::uint8_t> grown(new_size, 0);
    std::copy(data.begin(), data.end(), grown.begin());
    clear();
    data = std::move(grown);
}

}
