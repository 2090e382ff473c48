#pragma once

#include "chatvault/core/config.hpp"
#include "chatvault/core/result.hpp"
#include "chatvault/crypto/encryption.hpp"
#include "chatvault/remote/message.hpp"
#include "chatvault/storage/chunker.hpp"
#include "chatvault/storage/compression.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chatvault::storage {

struct VaultConfig {
    std::optional<remote::ChannelId> channel_id;

    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    bool compression = true;
    bool encryption = true;
    int compression_level = DEFAULT_COMPRESSION_LEVEL;

    uint32_t parallel_uploads = 3;
    uint32_t max_retries = 5;
    std::chrono::milliseconds retry_delay{1000};
    std::chrono::milliseconds max_backoff{60000};

    crypto::KdfParams kdf = crypto::KdfParams::interactive();

    std::filesystem::path store_database = "chatvault_store.db";
    std::string store_session;
    // Empty disables upload resume.
    std::filesystem::path resume_database;

    VaultConfig() = default;

    static VaultConfig from_config(const core::Config& config);

    // Writes the values back under the keys from_config() reads.
    void to_config(core::Config& config) const;

    core::VaultResult validate() const;
};

}
