#include "chatvault/core/cli.hpp"
#include "chatvault/core/utils.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

#ifndef CHATVAULT_VERSION
#define CHATVAULT_VERSION "0.1.0"
#endif

namespace chatvault::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.chatvault.conf");
    add_option("p", "password", "Encryption password (or set CHATVAULT_PASSWORD)", true);
    add_option("o", "output", "Download destination file or directory", true);
    add_option("", "verbose", "Enable debug logging");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    const std::string key = long_name.empty() ? short_name : long_name;
    options_[key] = Option{long_name, description, has_value, default_value};

    if (!short_name.empty()) {
        short_to_long_[short_name] = key;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // "--" ends option parsing; file names may start with a dash.
        if (arg == "--") {
            positional_args_.insert(positional_args_.end(), argv + i + 1, argv + argc);
            return true;
        }

        bool ok = true;
        if (arg.starts_with("--")) {
            ok = parse_long_option(arg, i, argc, argv);
        } else if (arg.size() > 1 && arg.front() == '-') {
            ok = parse_short_options(arg, i, argc, argv);
        } else {
            positional_args_.push_back(std::move(arg));
        }

        if (!ok) {
            return false;
        }
    }

    return true;
}

bool CommandLineParser::parse_long_option(const std::string& arg, int& i, int argc, char* argv[]) {
    auto eq_pos = arg.find('=');
    std::string name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

    auto it = options_.find(name);
    if (it == options_.end()) {
        error_ = "Unknown option: --" + name;
        return false;
    }

    if (!it->second.has_value) {
        if (eq_pos != std::string::npos) {
            error_ = "Option --" + name + " does not take a value";
            return false;
        }
        parsed_options_[name] = "true";
        return true;
    }

    if (eq_pos != std::string::npos) {
        parsed_options_[name] = arg.substr(eq_pos + 1);
    } else if (i + 1 < argc) {
        parsed_options_[name] = argv[++i];
    } else {
        error_ = "Option --" + name + " requires a value";
        return false;
    }
    return true;
}

bool CommandLineParser::parse_short_options(const std::string& arg, int& i, int argc, char* argv[]) {
    // Flags may be bundled ("-hv"); a value option takes the rest of the word or the next one.
    for (size_t j = 1; j < arg.size(); ++j) {
        std::string short_name(1, arg[j]);

        auto it = short_to_long_.find(short_name);
        if (it == short_to_long_.end()) {
            error_ = "Unknown option: -" + short_name;
            return false;
        }

        const std::string& name = it->second;
        if (!options_.at(name).has_value) {
            parsed_options_[name] = "true";
            continue;
        }

        if (j + 1 < arg.size()) {
            parsed_options_[name] = arg.substr(j + 1);
        } else if (i + 1 < argc) {
            parsed_options_[name] = argv[++i];
        } else {
            error_ = "Option -" + short_name + " requires a value";
            return false;
        }
        break;
    }
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(normalize_option_name(name)) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    std::string key = normalize_option_name(name);

    if (auto it = parsed_options_.find(key); it != parsed_options_.end()) {
        return it->second;
    }

    if (auto it = options_.find(key); it != options_.end() && !it->second.default_value.empty()) {
        return it->second.default_value;
    }

    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto value = get_option(name);
    if (value.empty()) return default_value;

    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        return default_value;
    }
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) return default_value;

    auto value = utils::StringUtils::to_lower(get_option(name));
    return value == "true" || value == "1" || value == "yes" || value.empty();
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    std::map<std::string, std::string> long_to_short;
    for (const auto& [short_name, long_name] : short_to_long_) {
        long_to_short[long_name] = short_name;
    }

    for (const auto& [name, option] : options_) {
        std::string flag = "--" + name;
        if (auto it = long_to_short.find(name); it != long_to_short.end()) {
            flag = "-" + it->second + ", " + flag;
        }
        if (option.has_value) {
            flag += " <value>";
        }

        std::cout << "  " << std::left << std::setw(24) << flag << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version " << CHATVAULT_VERSION << "\n";
    std::cout << "Chunked, encrypted file storage on chat-style message stores\n";
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    auto it = short_to_long_.find(name);
    return it != short_to_long_.end() ? it->second : name;
}

}
