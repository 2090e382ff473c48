#include "chatvault/storage/vault_config.hpp"
#include "chatvault/core/utils.hpp"

namespace chatvault::storage {

using core::VaultError;
using core::VaultResult;

VaultConfig VaultConfig::from_config(const core::Config& config) {
    VaultConfig result;

    if (auto channel = config.get_as<long long>("vault.channel_id")) {
        result.channel_id = static_cast<remote::ChannelId>(*channel);
    }

    result.chunk_size = static_cast<uint64_t>(
        config.get_int64("vault.chunk_size", static_cast<long long>(DEFAULT_CHUNK_SIZE)));
    result.compression = config.get_bool("vault.compression", true);
    result.encryption = config.get_bool("vault.encryption", true);
    result.compression_level = config.get_int("vault.compression_level", DEFAULT_COMPRESSION_LEVEL);

    result.parallel_uploads = static_cast<uint32_t>(config.get_int("transfer.parallel_uploads", 3));
    result.max_retries = static_cast<uint32_t>(config.get_int("transfer.max_retries", 5));
    result.retry_delay = std::chrono::milliseconds(config.get_int64("transfer.retry_delay_ms", 1000));
    result.max_backoff = std::chrono::milliseconds(config.get_int64("transfer.max_backoff_ms", 60000));

    auto defaults = crypto::KdfParams::interactive();
    result.kdf.opslimit = static_cast<std::uint64_t>(
        config.get_int64("crypto.kdf_opslimit", static_cast<long long>(defaults.opslimit)));
    result.kdf.memlimit = static_cast<size_t>(
        config.get_int64("crypto.kdf_memlimit", static_cast<long long>(defaults.memlimit)));

    result.store_database = core::utils::FileUtils::expand_user(
        config.get_string("store.database", "chatvault_store.db"));
    result.store_session = config.get_string("store.session");

    auto resume = config.get_string("resume.database");
    if (!resume.empty()) {
        result.resume_database = core::utils::FileUtils::expand_user(resume);
    }

    return result;
}

void VaultConfig::to_config(core::Config& config) const {
    if (channel_id) {
        config.set("vault.channel_id", std::to_string(*channel_id));
    }
    config.set("vault.chunk_size", std::to_string(chunk_size));
    config.set("vault.compression", compression ? "true" : "false");
    config.set("vault.encryption", encryption ? "true" : "false");
    config.set("vault.compression_level", std::to_string(compression_level));
    config.set("transfer.parallel_uploads", std::to_string(parallel_uploads));
    config.set("transfer.max_retries", std::to_string(max_retries));
    config.set("transfer.retry_delay_ms", std::to_string(retry_delay.count()));
    config.set("transfer.max_backoff_ms", std::to_string(max_backoff.count()));
    config.set("crypto.kdf_opslimit", std::to_string(kdf.opslimit));
    config.set("crypto.kdf_memlimit", std::to_string(kdf.memlimit));
    config.set("store.database", store_database.string());
    if (!store_session.empty()) {
        config.set("store.session", store_session);
    }
    if (!resume_database.empty()) {
        config.set("resume.database", resume_database.string());
    }
}

VaultResult VaultConfig::validate() const {
    auto result = validate_chunk_size(chunk_size);
    if (!result) {
        return result;
    }

    if (parallel_uploads == 0) {
        return VaultResult(VaultError::INVALID_CONFIGURATION, "transfer.parallel_uploads must be at least 1");
    }

    if (compression_level < 1 || compression_level > 9) {
        return VaultResult(VaultError::INVALID_CONFIGURATION,
                           "vault.compression_level must be 1..9, got " + std::to_string(compression_level));
    }

    if (retry_delay.count() < 0 || max_backoff < retry_delay) {
        return VaultResult(VaultError::INVALID_CONFIGURATION,
                           "transfer.retry_delay_ms must be non-negative and not exceed transfer.max_backoff_ms");
    }

    if (!kdf.valid()) {
        return VaultResult(VaultError::INVALID_CONFIGURATION, "Argon2id limits are out of range");
    }

    return VaultResult();
}

}
