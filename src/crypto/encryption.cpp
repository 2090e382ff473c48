#include "chatvault/crypto/encryption.hpp"
#include "chatvault/crypto/random.hpp"
#include <sodium.h>
#include <algorithm>

namespace chatvault::crypto {

namespace {
    void wipe(std::string& secret) {
        if (!secret.empty()) {
            sodium_memzero(secret.data(), secret.size());
            secret.clear();
        }
    }

    CryptoResult aead_encrypt(std::span<const std::uint8_t> plaintext,
                              const Nonce& nonce,
                              const SecureBytes& key,
                              std::uint8_t* out) {
        unsigned long long ciphertext_len = 0;
        int result = crypto_aead_chacha20poly1305_ietf_encrypt(
            out,
            &ciphertext_len,
            plaintext.data(),
            plaintext.size(),
            nullptr,
            0,
            nullptr,  // nsec (not used)
            nonce.data(),
            key.data_ptr()
        );

        if (result != 0 || ciphertext_len != plaintext.size() + TAG_SIZE) {
            return CryptoResult(CryptoError::ENCRYPTION_FAILED, "ChaCha20-Poly1305 encryption failed");
        }
        return CryptoResult();
    }

    CryptoResult aead_decrypt(std::span<const std::uint8_t> ciphertext_with_tag,
                              const Nonce& nonce,
                              const SecureBytes& key,
                              std::vector<std::uint8_t>& out_plaintext) {
        if (ciphertext_with_tag.size() < TAG_SIZE) {
            return CryptoResult(CryptoError::INVALID_FORMAT, "Ciphertext shorter than authentication tag");
        }

        std::vector<std::uint8_t> plaintext(ciphertext_with_tag.size() - TAG_SIZE);
        unsigned long long plaintext_len = 0;

        int result = crypto_aead_chacha20poly1305_ietf_decrypt(
            plaintext.data(),
            &plaintext_len,
            nullptr,  // nsec (not used)
            ciphertext_with_tag.data(),
            ciphertext_with_tag.size(),
            nullptr,
            0,
            nonce.data(),
            key.data_ptr()
        );

        if (result != 0) {
            sodium_memzero(plaintext.data(), plaintext.size());
            out_plaintext.clear();
            return CryptoResult(CryptoError::DECRYPTION_FAILED,
                                "Authentication failed: wrong password or corrupted data");
        }

        plaintext.resize(plaintext_len);
        out_plaintext = std::move(plaintext);
        return CryptoResult();
    }
}

KdfParams KdfParams::interactive() {
    return KdfParams{crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
}

KdfParams KdfParams::moderate() {
    return KdfParams{crypto_pwhash_OPSLIMIT_MODERATE, crypto_pwhash_MEMLIMIT_MODERATE};
}

KdfParams KdfParams::minimal() {
    return KdfParams{crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
}

bool KdfParams::valid() const {
    return opslimit >= crypto_pwhash_OPSLIMIT_MIN && opslimit <= crypto_pwhash_OPSLIMIT_MAX &&
           memlimit >= crypto_pwhash_MEMLIMIT_MIN && memlimit <= crypto_pwhash_MEMLIMIT_MAX;
}

std::vector<std::uint8_t> EncryptionHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(HEADER_SIZE);
    buffer.insert(buffer.end(), salt.begin(), salt.end());
    buffer.insert(buffer.end(), nonce.begin(), nonce.end());
    return buffer;
}

CryptoResult EncryptionHeader::parse(std::span<const std::uint8_t> data, EncryptionHeader& out) {
    if (data.size() < HEADER_SIZE) {
        return CryptoResult(CryptoError::INVALID_FORMAT,
                            "Header too short: " + std::to_string(data.size()) + " < " +
                            std::to_string(HEADER_SIZE));
    }

    std::copy(data.begin(), data.begin() + SALT_SIZE, out.salt.begin());
    std::copy(data.begin() + SALT_SIZE, data.begin() + HEADER_SIZE, out.nonce.begin());
    return CryptoResult();
}

EncryptionHeader EncryptionHeader::generate() {
    return EncryptionHeader{SecureRandom::generate_salt(), SecureRandom::generate_nonce()};
}

CryptoResult KeyDerivation::derive_key(const std::string& password,
                                       const Salt& salt,
                                       const KdfParams& params,
                                       SecureBytes& out_key) {
    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::INVALID_STATE, "libsodium is not available");
    }

    if (!params.valid()) {
        return CryptoResult(CryptoError::KEY_DERIVATION_FAILED, "Argon2id parameters out of range");
    }

    out_key.resize(KEY_SIZE);
    if (crypto_pwhash(out_key.data_ptr(), out_key.size(),
                      password.data(), password.size(),
                      salt.data(),
                      params.opslimit, params.memlimit,
                      crypto_pwhash_ALG_ARGON2ID13) != 0) {
        out_key.clear();
        return CryptoResult(CryptoError::KEY_DERIVATION_FAILED, "Argon2id key derivation ran out of memory");
    }

    return CryptoResult();
}

ChunkCipher::ChunkCipher(KdfParams params)
    : params_(params) {
}

CryptoResult ChunkCipher::encrypt(std::span<const std::uint8_t> plaintext,
                                  const std::string& password,
                                  std::vector<std::uint8_t>& out_ciphertext) const {
    auto header = EncryptionHeader::generate();

    SecureBytes key;
    auto result = KeyDerivation::derive_key(password, header.salt, params_, key);
    if (!result) {
        return result;
    }

    std::vector<std::uint8_t> wire = header.serialize();
    wire.resize(HEADER_SIZE + plaintext.size() + TAG_SIZE);

    result = aead_encrypt(plaintext, header.nonce, key, wire.data() + HEADER_SIZE);
    if (!result) {
        return result;
    }

    out_ciphertext = std::move(wire);
    return CryptoResult();
}

CryptoResult ChunkCipher::decrypt(std::span<const std::uint8_t> ciphertext,
                                  const std::string& password,
                                  std::vector<std::uint8_t>& out_plaintext) const {
    out_plaintext.clear();

    if (ciphertext.size() < MIN_CIPHERTEXT_SIZE) {
        return CryptoResult(CryptoError::INVALID_FORMAT,
                            "Encrypted chunk too short: " + std::to_string(ciphertext.size()) + " bytes");
    }

    EncryptionHeader header;
    auto result = EncryptionHeader::parse(ciphertext, header);
    if (!result) {
        return result;
    }

    SecureBytes key;
    result = KeyDerivation::derive_key(password, header.salt, params_, key);
    if (!result) {
        return result;
    }

    return aead_decrypt(ciphertext.subspan(HEADER_SIZE), header.nonce, key, out_plaintext);
}

StreamingEncryptor::StreamingEncryptor(std::string password, KdfParams params)
    : password_(std::move(password))
    , params_(params)
    , header_()
    , counter_(0) {
}

CryptoResult StreamingEncryptor::initialize() {
    header_ = EncryptionHeader::generate();
    auto result = KeyDerivation::derive_key(password_, header_.salt, params_, key_);
    wipe(password_);
    counter_ = 0;
    return result;
}

std::vector<std::uint8_t> StreamingEncryptor::header() const {
    return header_.serialize();
}

Nonce StreamingEncryptor::block_nonce(const Nonce& base, std::uint64_t counter) {
    Nonce nonce = base;
    for (size_t i = 0; i < 8; ++i) {
        nonce[i] ^= static_cast<std::uint8_t>((counter >> (56 - 8 * i)) & 0xFF);
    }
    return nonce;
}

CryptoResult StreamingEncryptor::encrypt_block(std::span<const std::uint8_t> data,
                                               std::vector<std::uint8_t>& out_block) {
    if (key_.empty()) {
        return CryptoResult(CryptoError::INVALID_STATE, "Streaming encryptor not initialized");
    }

    if (counter_ >= MAX_BLOCKS) {
        return CryptoResult(CryptoError::LIMIT_EXCEEDED, "Block limit reached for this key");
    }

    auto nonce = block_nonce(header_.nonce, counter_);

    std::vector<std::uint8_t> block(NONCE_SIZE + data.size() + TAG_SIZE);
    std::copy(nonce.begin(), nonce.end(), block.begin());

    auto result = aead_encrypt(data, nonce, key_, block.data() + NONCE_SIZE);
    if (!result) {
        return result;
    }

    ++counter_;
    out_block = std::move(block);
    return CryptoResult();
}

StreamingDecryptor::StreamingDecryptor(std::string password, KdfParams params)
    : password_(std::move(password))
    , params_(params)
    , header_() {
}

CryptoResult StreamingDecryptor::initialize(std::span<const std::uint8_t> header) {
    auto result = EncryptionHeader::parse(header, header_);
    if (!result) {
        return result;
    }

    result = KeyDerivation::derive_key(password_, header_.salt, params_, key_);
    wipe(password_);
    return result;
}

CryptoResult StreamingDecryptor::decrypt_block(std::span<const std::uint8_t> block,
                                               std::vector<std::uint8_t>& out_data) const {
    if (key_.empty()) {
        return CryptoResult(CryptoError::INVALID_STATE, "Streaming decryptor not initialized");
    }

    if (block.size() < NONCE_SIZE + TAG_SIZE) {
        return CryptoResult(CryptoError::INVALID_FORMAT, "Encrypted block too short");
    }

    Nonce nonce;
    std::copy(block.begin(), block.begin() + NONCE_SIZE, nonce.begin());
    return aead_decrypt(block.subspan(NONCE_SIZE), nonce, key_, out_data);
}

}
