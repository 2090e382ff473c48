#pragma once

#include "crypto_types.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace chatvault::crypto {

// Argon2id cost parameters. They are not carried on the wire, so the writer
// and every reader of a vault must use the same values.
struct KdfParams {
    std::uint64_t opslimit;
    size_t memlimit;

    static KdfParams interactive();
    static KdfParams moderate();
    static KdfParams minimal();

    bool valid() const;
};

struct EncryptionHeader {
    Salt salt;
    Nonce nonce;

    std::vector<std::uint8_t> serialize() const;
    static CryptoResult parse(std::span<const std::uint8_t> data, EncryptionHeader& out);
    static EncryptionHeader generate();
};

class KeyDerivation {
public:
    // Stretches the password into a 256-bit key; `out_key` is resized to KEY_SIZE.
    static CryptoResult derive_key(const std::string& password,
                                   const Salt& salt,
                                   const KdfParams& params,
                                   SecureBytes& out_key);
};

/**
 * One-shot authenticated encryption of a single chunk.
 *
 * Wire format: salt(16) || nonce(12) || ciphertext || tag(16). Salt and nonce
 * are fresh for every call and the key is derived from the password and salt
 * each time, so chunks never share key material.
 */
class ChunkCipher {
public:
    explicit ChunkCipher(KdfParams params = KdfParams::interactive());

    CryptoResult encrypt(std::span<const std::uint8_t> plaintext,
                         const std::string& password,
                         std::vector<std::uint8_t>& out_ciphertext) const;

    // DECRYPTION_FAILED on a wrong password or tampered bytes; out_plaintext is left empty.
    CryptoResult decrypt(std::span<const std::uint8_t> ciphertext,
                         const std::string& password,
                         std::vector<std::uint8_t>& out_plaintext) const;

    const KdfParams& params() const { return params_; }

private:
    KdfParams params_;
};

/**
 * Per-file streaming encryption with a single derived key.
 *
 * Block nonce = base nonce with its first 8 bytes XORed with a big-endian
 * block counter. Each block is emitted as nonce || ciphertext || tag so it can
 * be decrypted on its own.
 */
class StreamingEncryptor {
public:
    static constexpr std::uint64_t MAX_BLOCKS = 1ULL << 32;

    StreamingEncryptor(std::string password, KdfParams params = KdfParams::interactive());

    CryptoResult initialize();

    // salt || base nonce, written once in front of the block stream.
    std::vector<std::uint8_t> header() const;

    CryptoResult encrypt_block(std::span<const std::uint8_t> data, std::vector<std::uint8_t>& out_block);

    std::uint64_t blocks_encrypted() const { return counter_; }

    static Nonce block_nonce(const Nonce& base, std::uint64_t counter);

private:
    std::string password_;
    KdfParams params_;
    EncryptionHeader header_;
    SecureBytes key_;
    std::uint64_t counter_;
};

class StreamingDecryptor {
public:
    StreamingDecryptor(std::string password, KdfParams params = KdfParams::interactive());

    CryptoResult initialize(std::span<const std::uint8_t> header);

    CryptoResult decrypt_block(std::span<const std::uint8_t> block, std::vector<std::uint8_t>& out_data) const;

private:
    std::string password_;
    KdfParams params_;
    EncryptionHeader header_;
    SecureBytes key_;
};

}
