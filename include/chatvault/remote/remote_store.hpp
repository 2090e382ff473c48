#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/remote/message.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chatvault::remote {

/**
 * Message-oriented blob host the vault is built on.
 *
 * A channel holds text messages (editable, pinnable) and blob messages with a
 * filename and an optional reply-to link. There are no directories and no
 * transactions. Implementations must tolerate concurrent send_blob() calls.
 * Any call may block; send_blob() may fail with RATE_LIMITED and a mandatory
 * wait in VaultResult::retry_after.
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    virtual core::VaultResult connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual bool is_authorized() const = 0;
    // Exchanges a credential for a session token.
    virtual core::VaultResult authorize(const std::string& credential, std::string& out_session) = 0;

    virtual core::VaultResult create_channel(const std::string& title, ChannelId& out_channel) = 0;
    virtual core::VaultResult open_channel(ChannelId channel) = 0;

    virtual core::VaultResult send_text(ChannelId channel, const std::string& text, MessageRef& out_ref) = 0;
    virtual core::VaultResult edit_text(ChannelId channel, MessageRef ref, const std::string& text) = 0;
    virtual core::VaultResult get_message(ChannelId channel, MessageRef ref, StoredMessage& out_message) = 0;

    virtual core::VaultResult send_blob(ChannelId channel,
                                        std::span<const uint8_t> data,
                                        const std::string& filename,
                                        std::optional<MessageRef> reply_to,
                                        MessageRef& out_ref) = 0;
    virtual core::VaultResult get_blob(ChannelId channel, MessageRef ref, std::vector<uint8_t>& out_data) = 0;

    // Most recent first.
    virtual core::VaultResult list_messages(ChannelId channel,
                                            const MessageFilter& filter,
                                            std::vector<StoredMessage>& out_messages) = 0;

    virtual core::VaultResult pin(ChannelId channel, MessageRef ref) = 0;
    virtual core::VaultResult delete_messages(ChannelId channel, const std::vector<MessageRef>& refs) = 0;
};

}
