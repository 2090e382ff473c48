#include "chatvault/core/config.hpp"
#include "chatvault/core/utils.hpp"
#include <array>
#include <utility>

namespace chatvault::core {

namespace {
    using utils::StringUtils;

    constexpr std::array<std::pair<const char*, const char*>, 12> DEFAULTS = {{
        {"vault.chunk_size", "104857600"},
        {"vault.compression", "true"},
        {"vault.encryption", "true"},
        {"vault.compression_level", "6"},
        {"transfer.parallel_uploads", "3"},
        {"transfer.max_retries", "5"},
        {"transfer.retry_delay_ms", "1000"},
        {"transfer.max_backoff_ms", "60000"},
        {"store.database", "chatvault_store.db"},
        {"resume.database", "chatvault_resume.db"},
        {"log.level", "info"},
        {"log.file", "chatvault.log"},
    }};

    // "key = value"; blank lines, comments and lines without '=' yield nothing.
    std::optional<std::pair<std::string, std::string>> parse_line(const std::string& raw) {
        std::string line = StringUtils::trim(raw);
        if (line.empty() || line.front() == '#') {
            return std::nullopt;
        }

        auto separator = line.find('=');
        if (separator == std::string::npos) {
            return std::nullopt;
        }

        std::string key = StringUtils::trim(line.substr(0, separator));
        if (key.empty()) {
            return std::nullopt;
        }
        return std::make_pair(std::move(key), StringUtils::trim(line.substr(separator + 1)));
    }

    std::string section_of(const std::string& key) {
        auto dot = key.find('.');
        return dot == std::string::npos ? std::string() : key.substr(0, dot);
    }
}

Config& Config::instance() {
    static Config shared;
    return shared;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        return false;
    }

    for (std::string raw; std::getline(in, raw);) {
        if (auto entry = parse_line(raw)) {
            values_[entry->first] = std::move(entry->second);
        }
    }
    return !in.bad();
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream out(filename, std::ios::trunc);
    if (!out) {
        return false;
    }

    out << "# chatvault configuration\n";

    // Keys are sorted, so each section is contiguous.
    std::string current_section;
    bool first = true;
    for (const auto& [key, value] : values_) {
        auto section = section_of(key);
        if (first || section != current_section) {
            out << "\n";
            current_section = section;
            first = false;
        }
        out << key << " = " << value << "\n";
    }

    out.flush();
    return static_cast<bool>(out);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    if (auto it = values_.find(key); it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }

    auto lowered = StringUtils::to_lower(*value);
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
        return false;
    }
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

long long Config::get_int64(const std::string& key, long long default_value) const {
    return get_as<long long>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    for (const auto& [key, value] : DEFAULTS) {
        values_[key] = value;
    }
}

}
