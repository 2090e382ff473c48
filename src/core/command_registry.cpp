#include "chatvault/core/command_registry.hpp"
#include <iostream>
#include <iomanip>

namespace chatvault::core {

CommandRegistry::CommandRegistry(CommandContext& context) {
    register_command("login", std::make_unique<LoginCommandHandler>(context));
    register_command("setup", std::make_unique<SetupCommandHandler>(context));
    register_command("upload", std::make_unique<UploadCommandHandler>(context));
    register_command("download", std::make_unique<DownloadCommandHandler>(context));
    register_command("list", std::make_unique<ListCommandHandler>(context));
    register_command("search", std::make_unique<SearchCommandHandler>(context));
    register_command("delete", std::make_unique<DeleteCommandHandler>(context));
    register_command("status", std::make_unique<StatusCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }

    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";

    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(12) << name
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(12) << " "
                  << handler->get_usage() << "\n";
    }
}

}
