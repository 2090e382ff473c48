#include "chatvault/transfer/index_manager.hpp"
#include "chatvault/core/logger.hpp"

namespace chatvault::transfer {

using core::VaultError;
using core::VaultResult;

IndexManager::IndexManager(remote::RemoteStore& store, remote::ChannelId channel)
    : store_(store)
    , channel_(channel) {
}

VaultResult IndexManager::locate(std::optional<remote::MessageRef>& out_ref, storage::VaultIndex* out_index) {
    out_ref.reset();

    std::vector<remote::StoredMessage> messages;
    auto result = store_.list_messages(channel_, remote::MessageFilter::latest(INDEX_SCAN_WINDOW), messages);
    if (!result) {
        return result;
    }

    result = pick_index(messages, out_ref, out_index);
    if (!result || out_ref) {
        return result;
    }

    // Large uploads push the index out of the recent window.
    result = store_.list_messages(channel_, remote::MessageFilter::pinned(), messages);
    if (!result) {
        return result;
    }

    return pick_index(messages, out_ref, out_index);
}

VaultResult IndexManager::pick_index(const std::vector<remote::StoredMessage>& messages,
                                     std::optional<remote::MessageRef>& out_ref,
                                     storage::VaultIndex* out_index) const {
    for (const auto& message : messages) {
        if (!message.pinned || !message.text || !storage::VaultIndex::looks_like_index(*message.text)) {
            continue;
        }

        storage::VaultIndex index;
        auto parsed = storage::VaultIndex::from_json(*message.text, index);
        if (!parsed) {
            LOG_WARN("Skipping pinned message {} in channel {}: {}", message.ref, channel_, parsed.message);
            continue;
        }

        if (out_index) {
            *out_index = std::move(index);
        }
        out_ref = message.ref;
        return VaultResult();
    }

    return VaultResult();
}

VaultResult IndexManager::load(storage::VaultIndex& out_index) {
    storage::VaultIndex index;
    std::optional<remote::MessageRef> ref;

    auto result = locate(ref, &index);
    if (!result) {
        return result;
    }

    if (!ref) {
        LOG_DEBUG("No index pinned in channel {}, starting empty", channel_);
        index = storage::VaultIndex();
    }

    index_ref_ = ref;
    out_index = std::move(index);
    return VaultResult();
}

VaultResult IndexManager::save(const storage::VaultIndex& index) {
    std::optional<remote::MessageRef> ref;
    auto result = locate(ref, nullptr);
    if (!result) {
        return result;
    }

    auto text = index.to_json();

    if (ref) {
        result = store_.edit_text(channel_, *ref, text);
        if (!result) {
            return result;
        }
        index_ref_ = ref;
        return VaultResult();
    }

    remote::MessageRef new_ref = 0;
    result = store_.send_text(channel_, text, new_ref);
    if (!result) {
        return result;
    }

    result = store_.pin(channel_, new_ref);
    if (!result) {
        return result;
    }

    LOG_INFO("Created vault index in channel {}", channel_);
    index_ref_ = new_ref;
    return VaultResult();
}

VaultResult IndexManager::fetch_metadata(remote::MessageRef ref, storage::FileMetadata& out_metadata) {
    remote::StoredMessage message;
    auto result = store_.get_message(channel_, ref, message);
    if (!result) {
        return result;
    }

    if (!message.text) {
        return VaultResult(VaultError::INVALID_RECORD,
                           "Message " + std::to_string(ref) + " is not a metadata record");
    }

    return storage::FileMetadata::from_json(*message.text, out_metadata);
}

}
