#pragma once

#include "chatvault/remote/remote_store.hpp"
#include <filesystem>
#include <mutex>

struct sqlite3;

namespace chatvault::remote {

/**
 * RemoteStore over a local SQLite database.
 *
 * Mirrors the chat-service model (channels, text and blob messages, pins,
 * reply links) so the vault can run end to end without a network service.
 * Authorization is local: any non-empty credential is exchanged for a
 * session token that is remembered in the database.
 */
class SqliteStore : public RemoteStore {
public:
    explicit SqliteStore(const std::filesystem::path& database_path, std::string session = "");
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

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

    const std::string& session() const { return session_; }

private:
    std::filesystem::path db_path_;
    std::string session_;
    sqlite3* db_;
    bool authorized_;
    mutable std::mutex mutex_;

    bool create_tables();
    bool session_exists_locked(const std::string& token);
    core::VaultResult check_channel_locked(ChannelId channel);
    core::VaultResult sql_error(const std::string& what) const;
};

}
