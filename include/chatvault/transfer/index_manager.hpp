#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/remote/remote_store.hpp"
#include "chatvault/storage/file_metadata.hpp"
#include "chatvault/storage/vault_index.hpp"
#include <optional>
#include <vector>

namespace chatvault::transfer {

// Number of most recent messages searched for the pinned index record.
constexpr size_t INDEX_SCAN_WINDOW = 10;

/**
 * Loads and saves the pinned VaultIndex of a channel and fetches the
 * metadata records it points to.
 *
 * save() is a plain read-modify-write; callers are expected to be the only
 * writer of the channel.
 */
class IndexManager {
public:
    IndexManager(remote::RemoteStore& store, remote::ChannelId channel);

    // An empty index when none is pinned yet.
    core::VaultResult load(storage::VaultIndex& out_index);

    core::VaultResult save(const storage::VaultIndex& index);

    core::VaultResult fetch_metadata(remote::MessageRef ref, storage::FileMetadata& out_metadata);

    std::optional<remote::MessageRef> index_ref() const { return index_ref_; }

private:
    remote::RemoteStore& store_;
    remote::ChannelId channel_;
    std::optional<remote::MessageRef> index_ref_;

    core::VaultResult locate(std::optional<remote::MessageRef>& out_ref, storage::VaultIndex* out_index);
    // First pinned message that parses as an index; malformed look-alikes are skipped.
    core::VaultResult pick_index(const std::vector<remote::StoredMessage>& messages,
                                 std::optional<remote::MessageRef>& out_ref,
                                 storage::VaultIndex* out_index) const;
};

}
