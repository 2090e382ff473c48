#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/remote/remote_store.hpp"
#include "chatvault/storage/file_metadata.hpp"
#include "chatvault/storage/resume_manager.hpp"
#include "chatvault/storage/vault_config.hpp"
#include "chatvault/transfer/transfer_manager.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatvault::core {

struct VaultStatus {
    remote::ChannelId channel_id = 0;
    size_t file_count = 0;
    uint64_t total_size = 0;
    uint64_t stored_size = 0;
    // stored / total, 1.0 for an empty vault.
    double ratio = 1.0;
};

/**
 * Operation surface of the storage engine on one remote channel.
 *
 * Everything except login() and setup_channel() needs a connected store and
 * a configured channel.
 */
class Vault {
public:
    Vault(remote::RemoteStore& store, storage::VaultConfig config);
    ~Vault();

    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    VaultResult connect();
    void disconnect();

    // Connects if needed and exchanges the credential for a session token.
    VaultResult login(const std::string& credential, std::string& out_session);

    // Opens the given channel or creates a new one; an index is pinned if missing.
    VaultResult setup_channel(std::optional<remote::ChannelId> channel_id, remote::ChannelId& out_channel);

    VaultResult upload(const std::filesystem::path& file_path,
                       const transfer::UploadOptions& options,
                       storage::FileMetadata& out_metadata);

    VaultResult download(const std::string& id_or_name,
                         const transfer::DownloadOptions& options,
                         std::filesystem::path& out_path);

    VaultResult list_files(std::vector<storage::FileMetadata>& out_files);

    // Case-insensitive substring match on file names.
    VaultResult search(const std::string& query, std::vector<storage::FileMetadata>& out_files);

    // Id, or a single exact name. out_deleted is false when nothing matched.
    VaultResult delete_file(const std::string& id_or_name, bool& out_deleted);

    VaultResult status(VaultStatus& out_status);

    const storage::VaultConfig& config() const { return config_; }

    // Available once a channel is configured.
    transfer::TransferManager* transfers() { return transfers_.get(); }

private:
    remote::RemoteStore& store_;
    storage::VaultConfig config_;
    std::unique_ptr<storage::ResumeManager> resume_;
    std::unique_ptr<transfer::TransferManager> transfers_;

    VaultResult require_ready();
    void bind_channel(remote::ChannelId channel);
};

}
