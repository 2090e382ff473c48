#include "chatvault/remote/memory_store.hpp"
#include "chatvault/crypto/random.hpp"
#include "chatvault/crypto/hash.hpp"

namespace chatvault::remote {

using core::VaultError;
using core::VaultResult;

MemoryStore::MemoryStore()
    : connected_(false)
    , authorized_(true)
    , next_channel_(1000)
    , next_ref_(1) {
}

VaultResult MemoryStore::connect() {
    connected_ = true;
    return VaultResult();
}

void MemoryStore::disconnect() {
    connected_ = false;
}

bool MemoryStore::is_connected() const {
    return connected_;
}

bool MemoryStore::is_authorized() const {
    return authorized_;
}

VaultResult MemoryStore::authorize(const std::string& credential, std::string& out_session) {
    if (credential.empty()) {
        return VaultResult(VaultError::NOT_AUTHENTICATED, "Empty credential");
    }

    auto token = crypto::SecureRandom::generate_bytes(16);
    out_session = crypto::hash_utils::to_hex(token.span());
    authorized_ = true;
    return VaultResult();
}

VaultResult MemoryStore::check_channel_locked(ChannelId channel) const {
    if (!connected_) {
        return VaultResult(VaultError::NOT_CONNECTED, "Memory store is not connected");
    }
    if (!channels_.count(channel)) {
        return VaultResult(VaultError::REMOTE_ERROR, "Unknown channel " + std::to_string(channel));
    }
    return VaultResult();
}

VaultResult MemoryStore::create_channel(const std::string& title, ChannelId& out_channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return VaultResult(VaultError::NOT_CONNECTED, "Memory store is not connected");
    }

    out_channel = next_channel_++;
    channels_[out_channel].title = title;
    return VaultResult();
}

VaultResult MemoryStore::open_channel(ChannelId channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_channel_locked(channel);
}

VaultResult MemoryStore::send_text(ChannelId channel, const std::string& text, MessageRef& out_ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = check_channel_locked(channel);
    if (!result) {
        return result;
    }

    Entry entry;
    entry.message.ref = next_ref_++;
    entry.message.text = text;
    out_ref = entry.message.ref;
    channels_[channel].messages[out_ref] = std::move(entry);
    return VaultResult();
}

VaultResult MemoryStore::edit_text(ChannelId channel, MessageRef ref, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = check_channel_locked(channel);
    if (!result) {
        return result;
    }

    auto& messages = channels_[channel].messages;
    auto it = messages.find(ref);
    if (it == messages.end() || it->second.message.is_blob) {
        return VaultResult(VaultError::REMOTE_ERROR, "No text message " + std::to_string(ref));
    }

    it->second.message.text = text;
    return VaultResult();
}

VaultResult MemoryStore::get_message(ChannelId channel, MessageRef ref, StoredMessage& out_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = check_channel_locked(channel);
    if (!result) {
        return result;
    }

    const auto& messages = channels_[channel].messages;
    auto it = messages.find(ref);
    if (it == messages.end()) {
        return VaultResult(VaultError::FILE_NOT_FOUND, "No message " + std::to_string(ref));
    }

    out_message = it->second.message;
    return VaultResult();
}

VaultResult MemoryStore::send_blob(ChannelId channel,
                                   std::span<const uint8_t> data,
                                   const std::string& filename,
                                   std::optional<MessageRef> reply_to,
                                   MessageRef& out_ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = check_channel_locked(channel);
    if (!result) {
        return result;
    }

    Entry entry;
    entry.message.ref = next_ref_++;
    entry.message.is_blob = true;
    entry.message.reply_to = reply_to;
    entry.message.filename = filename;
    entry.message.blob_size = data.size();
    entry.blob.assign(data.begin(), data.end());

    out_ref = entry.message.ref;
    channels_[channel].messages[out_ref] = std::move(entry);
    return VaultResult();
}

VaultResult MemoryStore::get_blob(ChannelId channel, MessageRef ref, std::vector<uint8_t>& out_data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = check_channel_locked(channel);
    if (!result) {
        return result;
    }

    const auto& messages = channels_[channel].messages;
    auto it = messages.find(ref);
    if (it == messages.end() || !it->second.message.is_blob) {
        return VaultResult(VaultError::FILE_NOT_FOUND, "No blob message " + std::to_string(ref));
    }

    out_data = it->second.blob;
    return VaultResult();
}

VaultResult MemoryStore::list_messages(ChannelId channel,
                                       const MessageFilter& filter,
                                       std::vector<StoredMessage>& out_messages) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = check_channel_locked(channel);
    if (!result) {
        return result;
    }

    out_messages.clear();
    const auto& messages = channels_[channel].messages;
    for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
        const auto& message = it->second.message;
        if (filter.reply_to && message.reply_to != filter.reply_to) {
            continue;
        }
        if (filter.pinned_only && !message.pinned) {
            continue;
        }
        out_messages.push_back(message);
        if (filter.limit > 0 && out_messages.size() >= filter.limit) {
            break;
        }
    }

    return VaultResult();
}

VaultResult MemoryStore::pin(ChannelId channel, MessageRef ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = check_channel_locked(channel);
    if (!result) {
        return result;
    }

    auto& messages = channels_[channel].messages;
    auto it = messages.find(ref);
    if (it == messages.end()) {
        return VaultResult(VaultError::REMOTE_ERROR, "No message " + std::to_string(ref));
    }

    it->second.message.pinned = true;
    return VaultResult();
}

VaultResult MemoryStore::delete_messages(ChannelId channel, const std::vector<MessageRef>& refs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = check_channel_locked(channel);
    if (!result) {
        return result;
    }

    auto& messages = channels_[channel].messages;
    for (auto ref : refs) {
        messages.erase(ref);
    }
    return VaultResult();
}

size_t MemoryStore::message_count(ChannelId channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    return it == channels_.end() ? 0 : it->second.messages.size();
}

bool MemoryStore::corrupt_blob(ChannelId channel, MessageRef ref, size_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto channel_it = channels_.find(channel);
    if (channel_it == channels_.end()) {
        return false;
    }

    auto it = channel_it->second.messages.find(ref);
    if (it == channel_it->second.messages.end() || it->second.blob.size() <= offset) {
        return false;
    }

    it->second.blob[offset] ^= 0xFF;
    return true;
}

}
