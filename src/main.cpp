#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include "chatvault/core/logger.hpp"
#include "chatvault/core/config.hpp"
#include "chatvault/core/cli.hpp"
#include "chatvault/core/utils.hpp"
#include "chatvault/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    using namespace chatvault::core;

    CommandLineParser parser("chatvault");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = Config::instance();
    config.set_defaults();

    std::string config_file = parser.get_option("config", "~/.chatvault.conf");
    auto config_path = utils::FileUtils::expand_user(config_file);
    if (utils::FileUtils::exists(config_path) && !config.load_from_file(config_path.string())) {
        std::cerr << "Error: cannot read configuration " << config_path.string() << "\n";
        return 1;
    }

    auto log_level = parser.has_option("verbose")
        ? LogLevel::Debug
        : parse_log_level(config.get_string("log.level", "info"), LogLevel::Info);
    auto log_file = utils::FileUtils::expand_user(config.get_string("log.file", "chatvault.log"));
    Logger::initialize(log_file.string(), log_level);

    CommandContext context{config, config_path.string(), std::nullopt, std::nullopt};
    if (parser.has_option("password")) {
        context.password = parser.get_option("password");
    } else if (const char* env_password = std::getenv("CHATVAULT_PASSWORD")) {
        context.password = std::string(env_password);
    }
    if (parser.has_option("output")) {
        context.output = parser.get_option("output");
    }

    CommandRegistry command_registry(context);

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    std::string command = args[0];
    LOG_DEBUG("Running command '{}'", command);

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            command_registry.print_help();
        }
    }

    Logger::shutdown();
    return result.exit_code;
}
