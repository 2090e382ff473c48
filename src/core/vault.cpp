#include "chatvault/core/vault.hpp"
#include "chatvault/core/logger.hpp"
#include "chatvault/core/utils.hpp"
#include <algorithm>

namespace chatvault::core {

namespace {
    constexpr const char* CHANNEL_TITLE = "ChatVault Storage";
}

Vault::Vault(remote::RemoteStore& store, storage::VaultConfig config)
    : store_(store)
    , config_(std::move(config)) {
    if (!config_.resume_database.empty()) {
        resume_ = std::make_unique<storage::ResumeManager>(config_.resume_database);
        if (!resume_->initialize()) {
            LOG_WARN("Upload resume disabled: cannot open {}", config_.resume_database.string());
            resume_.reset();
        }
    }

    if (config_.channel_id) {
        bind_channel(*config_.channel_id);
    }
}

Vault::~Vault() = default;

void Vault::bind_channel(remote::ChannelId channel) {
    config_.channel_id = channel;
    transfers_ = std::make_unique<transfer::TransferManager>(store_, channel, config_, resume_.get());
}

VaultResult Vault::connect() {
    if (store_.is_connected()) {
        return VaultResult();
    }
    return store_.connect();
}

void Vault::disconnect() {
    store_.disconnect();
}

VaultResult Vault::require_ready() {
    if (!store_.is_connected()) {
        return VaultResult(VaultError::NOT_CONNECTED, "Not connected to the remote store");
    }
    if (!config_.channel_id || !transfers_) {
        return VaultResult(VaultError::NO_CHANNEL_CONFIGURED, "No storage channel configured; run setup first");
    }
    return VaultResult();
}

VaultResult Vault::login(const std::string& credential, std::string& out_session) {
    auto result = connect();
    if (!result) {
        return result;
    }

    result = store_.authorize(credential, out_session);
    if (!result) {
        return result;
    }

    config_.store_session = out_session;
    LOG_INFO("Logged in to the remote store");
    return VaultResult();
}

VaultResult Vault::setup_channel(std::optional<remote::ChannelId> channel_id, remote::ChannelId& out_channel) {
    if (!store_.is_connected()) {
        return VaultResult(VaultError::NOT_CONNECTED, "Not connected to the remote store");
    }
    if (!store_.is_authorized()) {
        return VaultResult(VaultError::NOT_AUTHENTICATED, "Log in before setting up a channel");
    }

    remote::ChannelId channel = 0;
    VaultResult result;
    if (channel_id) {
        channel = *channel_id;
        result = store_.open_channel(channel);
    } else {
        result = store_.create_channel(CHANNEL_TITLE, channel);
    }
    if (!result) {
        return result;
    }

    bind_channel(channel);

    storage::VaultIndex index;
    auto& index_manager = transfers_->index_manager();
    result = index_manager.load(index);
    if (!result) {
        return result;
    }
    if (!index_manager.index_ref()) {
        result = index_manager.save(index);
        if (!result) {
            return result;
        }
    }

    LOG_INFO("Using channel {}", channel);
    out_channel = channel;
    return VaultResult();
}

VaultResult Vault::upload(const std::filesystem::path& file_path,
                          const transfer::UploadOptions& options,
                          storage::FileMetadata& out_metadata) {
    auto result = require_ready();
    if (!result) {
        return result;
    }
    return transfers_->upload(file_path, options, out_metadata);
}

VaultResult Vault::download(const std::string& id_or_name,
                            const transfer::DownloadOptions& options,
                            std::filesystem::path& out_path) {
    auto result = require_ready();
    if (!result) {
        return result;
    }
    return transfers_->download(id_or_name, options, out_path);
}

VaultResult Vault::list_files(std::vector<storage::FileMetadata>& out_files) {
    auto result = require_ready();
    if (!result) {
        return result;
    }
    return transfers_->list_files(out_files);
}

VaultResult Vault::search(const std::string& query, std::vector<storage::FileMetadata>& out_files) {
    std::vector<storage::FileMetadata> files;
    auto result = list_files(files);
    if (!result) {
        return result;
    }

    out_files.clear();
    for (auto& file : files) {
        if (utils::StringUtils::contains_ignore_case(file.name, query)) {
            out_files.push_back(std::move(file));
        }
    }
    return VaultResult();
}

VaultResult Vault::delete_file(const std::string& id_or_name, bool& out_deleted) {
    out_deleted = false;
    auto result = require_ready();
    if (!result) {
        return result;
    }

    auto& index_manager = transfers_->index_manager();
    storage::VaultIndex index;
    result = index_manager.load(index);
    if (!result) {
        return result;
    }

    std::string file_id;
    if (index.contains(id_or_name)) {
        file_id = id_or_name;
    } else {
        std::vector<storage::FileMetadata> files;
        result = transfers_->list_files(files);
        if (!result) {
            return result;
        }

        std::vector<std::string> matches;
        for (const auto& file : files) {
            if (file.name == id_or_name) {
                matches.push_back(file.id);
            }
        }
        if (matches.size() > 1) {
            return VaultResult(VaultError::AMBIGUOUS_MATCH,
                               "'" + id_or_name + "' names " + std::to_string(matches.size()) + " files; delete by id");
        }
        if (matches.empty()) {
            return VaultResult();
        }
        file_id = matches.front();
    }

    auto metadata_ref = *index.find(file_id);
    auto channel = *config_.channel_id;
    std::vector<remote::MessageRef> refs{metadata_ref};

    storage::FileMetadata metadata;
    auto fetched = index_manager.fetch_metadata(metadata_ref, metadata);
    if (fetched) {
        for (const auto& chunk : metadata.chunks) {
            refs.push_back(chunk.remote_ref);
        }
    } else {
        LOG_WARN("Metadata of {} unreadable ({}), deleting by reply links only", file_id, fetched.message);
    }

    // Chunks of an interrupted earlier attempt are linked only by reply.
    std::vector<remote::StoredMessage> replies;
    result = store_.list_messages(channel, remote::MessageFilter::replies_to(metadata_ref), replies);
    if (!result) {
        return result;
    }
    for (const auto& reply : replies) {
        if (std::find(refs.begin(), refs.end(), reply.ref) == refs.end()) {
            refs.push_back(reply.ref);
        }
    }

    result = store_.delete_messages(channel, refs);
    if (!result) {
        return result;
    }

    index.remove_file(file_id);
    result = index_manager.save(index);
    if (!result) {
        return result;
    }

    LOG_INFO("Deleted {} ({} message(s))", file_id, refs.size());
    out_deleted = true;
    return VaultResult();
}

VaultResult Vault::status(VaultStatus& out_status) {
    std::vector<storage::FileMetadata> files;
    auto result = list_files(files);
    if (!result) {
        return result;
    }

    VaultStatus status;
    status.channel_id = *config_.channel_id;
    status.file_count = files.size();
    for (const auto& file : files) {
        status.total_size += file.size;
        status.stored_size += file.total_stored_size();
    }
    status.ratio = status.total_size > 0
        ? static_cast<double>(status.stored_size) / static_cast<double>(status.total_size)
        : 1.0;

    out_status = status;
    return VaultResult();
}

}
