#pragma once

#include "chatvault/remote/remote_store.hpp"
#include <atomic>
#include <map>
#include <mutex>

namespace chatvault::remote {

// Process-local RemoteStore. Used by tests and as a scratch backend.
class MemoryStore : public RemoteStore {
public:
    MemoryStore();
    ~MemoryStore() override = default;

    core::VaultResult connect() override;
    void disconnect() override;
    bool is_connected() const override;

    bool is_authorized() const override;
    core::VaultResult authorize(const std::string& credential, std::string& out_session) override;

    core::VaultResult create_channel(const std::string& title, ChannelId& out_channel) override;
    core::VaultResult open_channel(ChannelId channel) override;

    core::VaultResult send_text(ChannelId channel, const std::string& text, MessageRef& out_ref) override;
    core::VaultResult edit_text(ChannelId channel, MessageRef ref, const std::string& text) override;
    core::VaultResult get_message(ChannelId channel, MessageRef ref, StoredMessage& out_message) override;

    core::VaultResult send_blob(ChannelId channel,
                                std::span<const uint8_t> data,
                                const std::string& filename,
                                std::optional<MessageRef> reply_to,
                                MessageRef& out_ref) override;
    core::VaultResult get_blob(ChannelId channel, MessageRef ref, std::vector<uint8_t>& out_data) override;

    core::VaultResult list_messages(ChannelId channel,
                                    const MessageFilter& filter,
                                    std::vector<StoredMessage>& out_messages) override;

    core::VaultResult pin(ChannelId channel, MessageRef ref) override;
    core::VaultResult delete_messages(ChannelId channel, const std::vector<MessageRef>& refs) override;

    // Test hooks.
    void set_authorized(bool authorized) { authorized_ = authorized; }
    size_t message_count(ChannelId channel) const;
    bool corrupt_blob(ChannelId channel, MessageRef ref, size_t offset);

private:
    struct Entry {
        StoredMessage message;
        std::vector<uint8_t> blob;
    };

    struct Channel {
        std::string title;
        std::map<MessageRef, Entry> messages;
    };

    mutable std::mutex mutex_;
    std::atomic<bool> connected_;
    std::atomic<bool> authorized_;
    std::map<ChannelId, Channel> channels_;
    ChannelId next_channel_;
    MessageRef next_ref_;

    core::VaultResult check_channel_locked(ChannelId channel) const;
};

}
