#pragma once

#include "chatvault/core/config.hpp"
#include "chatvault/core/vault.hpp"
#include "chatvault/remote/sqlite_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatvault::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }

    static CommandResult from(const VaultResult& result) {
        if (result) {
            return ok();
        }
        return error(result.describe());
    }
};

// Shared state handed to every command.
struct CommandContext {
    Config& config;
    std::string config_path;
    std::optional<std::string> password;
    std::optional<std::string> output;
};

class CommandHandler {
public:
    explicit CommandHandler(CommandContext& context) : context_(context) {}
    virtual ~CommandHandler() = default;

    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;

protected:
    CommandContext& context_;

    // Local store plus a vault bound to the configured channel.
    struct Session {
        std::unique_ptr<remote::SqliteStore> store;
        std::unique_ptr<Vault> vault;
    };

    VaultResult open_session(Session& session);
    CommandResult save_config();
};

class LoginCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Authorize against the store and remember the session"; }
    std::string get_usage() const override { return "chatvault login <credential>"; }
};

class SetupCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Create a storage channel or adopt an existing one"; }
    std::string get_usage() const override { return "chatvault setup [channel-id]"; }
};

class UploadCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Upload files to the vault"; }
    std::string get_usage() const override { return "chatvault upload <file> [file...] [--password <pw>]"; }
};

class DownloadCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download a file by id or name"; }
    std::string get_usage() const override { return "chatvault download <id-or-name> [--output <path>] [--password <pw>]"; }
};

class ListCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List stored files"; }
    std::string get_usage() const override { return "chatvault list"; }
};

class SearchCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Find files whose name contains a string"; }
    std::string get_usage() const override { return "chatvault search <query>"; }
};

class DeleteCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Delete a file and its chunks"; }
    std::string get_usage() const override { return "chatvault delete <id-or-name>"; }
};

class StatusCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show vault statistics"; }
    std::string get_usage() const override { return "chatvault status"; }
};

}
