#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/crypto/encryption.hpp"
#include "chatvault/remote/remote_store.hpp"
#include "chatvault/storage/chunker.hpp"
#include "chatvault/storage/file_metadata.hpp"
#include "chatvault/storage/resume_manager.hpp"
#include "chatvault/storage/vault_config.hpp"
#include "chatvault/transfer/cancellation.hpp"
#include "chatvault/transfer/index_manager.hpp"
#include "chatvault/transfer/retry_policy.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatvault::transfer {

// (completed, total) in chunks. Counts never go backwards within a transfer.
using ProgressCallback = std::function<void(uint32_t, uint32_t)>;

struct UploadOptions {
    std::optional<std::string> password;
    ProgressCallback progress;
    std::shared_ptr<CancellationToken> cancel;
};

struct DownloadOptions {
    // File or existing directory; defaults to <cwd>/<stored name>.
    std::optional<std::filesystem::path> output;
    std::optional<std::string> password;
    ProgressCallback progress;
    std::shared_ptr<CancellationToken> cancel;
};

/**
 * Drives uploads and downloads between local files and a RemoteStore channel.
 *
 * Upload: split lazily, compress, encrypt and send chunks on a bounded worker
 * pool, then finalize the metadata record and publish it in the index.
 * Download: resolve, fetch chunks in order, verify stored digests before
 * decoding, reassemble and verify the whole-file hash.
 */
class TransferManager {
public:
    TransferManager(remote::RemoteStore& store,
                    remote::ChannelId channel,
                    const storage::VaultConfig& config,
                    storage::ResumeManager* resume = nullptr);
    ~TransferManager();

    core::VaultResult upload(const std::filesystem::path& file_path,
                             const UploadOptions& options,
                             storage::FileMetadata& out_metadata);

    core::VaultResult download(const std::string& id_or_name,
                               const DownloadOptions& options,
                               std::filesystem::path& out_path);

    // Exact id, then exact name, then substring of the name. Several matches
    // at the deciding step are AMBIGUOUS_MATCH.
    core::VaultResult resolve(const std::string& id_or_name, storage::FileMetadata& out_metadata);

    // Every readable metadata record in the index; unreadable ones are skipped.
    core::VaultResult list_files(std::vector<storage::FileMetadata>& out_files);

    IndexManager& index_manager() { return index_manager_; }
    RetryPolicy& retry_policy() { return retry_policy_; }

private:
    struct UploadState;

    remote::RemoteStore& store_;
    remote::ChannelId channel_;
    storage::VaultConfig config_;
    storage::ResumeManager* resume_;
    IndexManager index_manager_;
    RetryPolicy retry_policy_;
    crypto::ChunkCipher cipher_;

    core::VaultResult prepare_upload(const std::filesystem::path& file_path,
                                     const UploadOptions& options,
                                     UploadState& state);

    core::VaultResult process_chunk(const storage::Chunk& chunk,
                                    const UploadState& state,
                                    const UploadOptions& options,
                                    storage::ChunkInfo& out_info);

    core::VaultResult publish(UploadState& state, storage::FileMetadata& out_metadata);

    core::VaultResult fetch_chunk(const storage::FileMetadata& metadata,
                                  const storage::ChunkInfo& info,
                                  const DownloadOptions& options,
                                  storage::Chunk& out_chunk);
};

}
