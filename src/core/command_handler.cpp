#include "chatvault/core/command_handler.hpp"
#include "chatvault/core/logger.hpp"
#include "chatvault/core/utils.hpp"
#include "chatvault/storage/vault_config.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace chatvault::core {

using utils::StringUtils;
using utils::TimeUtils;

namespace {
    transfer::ProgressCallback print_progress(const std::string& label) {
        return [label](uint32_t completed, uint32_t total) {
            std::cout << "\r  " << label << " [" << completed << "/" << total << "]" << std::flush;
            if (completed == total) {
                std::cout << "\n";
            }
        };
    }

    void print_file_table(const std::vector<storage::FileMetadata>& files) {
        std::cout << std::left
                  << std::setw(14) << "ID"
                  << std::setw(12) << "SIZE"
                  << std::setw(8) << "CHUNKS"
                  << std::setw(6) << "FLAGS"
                  << std::setw(21) << "UPLOADED"
                  << "NAME\n";

        for (const auto& file : files) {
            std::string flags;
            flags += file.encrypted ? 'E' : '-';
            flags += file.compressed ? 'C' : '-';

            std::cout << std::left
                      << std::setw(14) << file.id
                      << std::setw(12) << StringUtils::format_bytes(file.size)
                      << std::setw(8) << file.chunk_count()
                      << std::setw(6) << flags
                      << std::setw(21) << TimeUtils::format_timestamp(TimeUtils::from_unix_seconds(file.created_at))
                      << file.name << "\n";
        }
    }
}

VaultResult CommandHandler::open_session(Session& session) {
    auto config = storage::VaultConfig::from_config(context_.config);
    auto result = config.validate();
    if (!result) {
        return result;
    }

    session.store = std::make_unique<remote::SqliteStore>(config.store_database, config.store_session);
    result = session.store->connect();
    if (!result) {
        return result;
    }

    session.vault = std::make_unique<Vault>(*session.store, config);
    return VaultResult();
}

CommandResult CommandHandler::save_config() {
    auto path = utils::FileUtils::expand_user(context_.config_path);
    if (!context_.config.save_to_file(path.string())) {
        return CommandResult::error("Cannot write configuration to " + path.string());
    }
    return CommandResult::ok();
}

CommandResult LoginCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    Session session;
    auto result = open_session(session);
    if (!result) {
        return CommandResult::from(result);
    }

    std::string token;
    result = session.vault->login(args[1], token);
    if (!result) {
        return CommandResult::from(result);
    }

    context_.config.set("store.session", token);
    auto saved = save_config();
    if (!saved.success) {
        return saved;
    }

    std::cout << "Logged in. Session saved to " << context_.config_path << "\n";
    return CommandResult::ok("Logged in");
}

CommandResult SetupCommandHandler::execute(const std::vector<std::string>& args) {
    std::optional<remote::ChannelId> requested;
    if (args.size() > 1) {
        try {
            requested = std::stoll(args[1]);
        } catch (const std::logic_error&) {
            return CommandResult::error("Invalid channel id: " + args[1]);
        }
    }

    Session session;
    auto result = open_session(session);
    if (!result) {
        return CommandResult::from(result);
    }

    remote::ChannelId channel = 0;
    result = session.vault->setup_channel(requested, channel);
    if (!result) {
        return CommandResult::from(result);
    }

    context_.config.set("vault.channel_id", std::to_string(channel));
    auto saved = save_config();
    if (!saved.success) {
        return saved;
    }

    std::cout << (requested ? "Using" : "Created") << " storage channel " << channel << "\n";
    return CommandResult::ok();
}

CommandResult UploadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    Session session;
    auto result = open_session(session);
    if (!result) {
        return CommandResult::from(result);
    }

    if (session.vault->config().encryption && !context_.password) {
        return CommandResult::error("Encryption is enabled; pass --password or set CHATVAULT_PASSWORD");
    }

    size_t failures = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        std::filesystem::path file_path = utils::FileUtils::expand_user(args[i]);

        transfer::UploadOptions options;
        options.password = context_.password;
        options.progress = print_progress(file_path.filename().string());

        storage::FileMetadata metadata;
        result = session.vault->upload(file_path, options, metadata);
        if (!result) {
            std::cerr << "Failed to upload " << file_path.string() << ": " << result.describe() << "\n";
            ++failures;
            continue;
        }

        std::cout << "Uploaded " << metadata.name << " as " << metadata.id
                  << " (" << StringUtils::format_bytes(metadata.size) << " -> "
                  << StringUtils::format_bytes(metadata.total_stored_size()) << ", "
                  << metadata.chunk_count() << " chunk(s))\n";
    }

    if (failures > 0) {
        return CommandResult::error(std::to_string(failures) + " of " + std::to_string(args.size() - 1) +
                                    " upload(s) failed");
    }
    return CommandResult::ok();
}

CommandResult DownloadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    Session session;
    auto result = open_session(session);
    if (!result) {
        return CommandResult::from(result);
    }

    transfer::DownloadOptions options;
    options.password = context_.password;
    options.progress = print_progress(args[1]);
    if (context_.output) {
        options.output = utils::FileUtils::expand_user(*context_.output);
    }

    std::filesystem::path saved_to;
    result = session.vault->download(args[1], options, saved_to);
    if (!result) {
        return CommandResult::from(result);
    }

    std::cout << "Saved to " << saved_to.string() << "\n";
    return CommandResult::ok();
}

CommandResult ListCommandHandler::execute(const std::vector<std::string>&) {
    Session session;
    auto result = open_session(session);
    if (!result) {
        return CommandResult::from(result);
    }

    std::vector<storage::FileMetadata> files;
    result = session.vault->list_files(files);
    if (!result) {
        return CommandResult::from(result);
    }

    if (files.empty()) {
        std::cout << "The vault is empty.\n";
        return CommandResult::ok();
    }

    print_file_table(files);
    return CommandResult::ok();
}

CommandResult SearchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    Session session;
    auto result = open_session(session);
    if (!result) {
        return CommandResult::from(result);
    }

    std::vector<storage::FileMetadata> files;
    result = session.vault->search(args[1], files);
    if (!result) {
        return CommandResult::from(result);
    }

    if (files.empty()) {
        std::cout << "No files match '" << args[1] << "'.\n";
        return CommandResult::ok();
    }

    print_file_table(files);
    return CommandResult::ok();
}

CommandResult DeleteCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    Session session;
    auto result = open_session(session);
    if (!result) {
        return CommandResult::from(result);
    }

    bool deleted = false;
    result = session.vault->delete_file(args[1], deleted);
    if (!result) {
        return CommandResult::from(result);
    }

    if (!deleted) {
        return CommandResult::error("No file with id or name '" + args[1] + "'");
    }

    std::cout << "Deleted " << args[1] << "\n";
    return CommandResult::ok();
}

CommandResult StatusCommandHandler::execute(const std::vector<std::string>&) {
    Session session;
    auto result = open_session(session);
    if (!result) {
        return CommandResult::from(result);
    }

    VaultStatus status;
    result = session.vault->status(status);
    if (!result) {
        return CommandResult::from(result);
    }

    std::cout << "Channel:      " << status.channel_id << "\n";
    std::cout << "Files:        " << status.file_count << "\n";
    std::cout << "Total size:   " << StringUtils::format_bytes(status.total_size) << "\n";
    std::cout << "Stored size:  " << StringUtils::format_bytes(status.stored_size) << "\n";
    std::cout << "Ratio:        " << std::fixed << std::setprecision(2) << status.ratio << "\n";
    return CommandResult::ok();
}

}
