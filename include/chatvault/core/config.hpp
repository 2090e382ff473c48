#pragma once

#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace chatvault::core {

// Flat "section.key = value" settings, loaded from and saved to a text file.
class Config {
public:
    Config() = default;

    static Config& instance();

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const { return values_.count(key) > 0; }

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;

        std::istringstream iss(*value);
        T result;
        if (!(iss >> result)) return std::nullopt;
        return result;
    }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    long long get_int64(const std::string& key, long long default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    void set_defaults();
    void clear() { values_.clear(); }

    const std::map<std::string, std::string>& values() const { return values_; }

private:
    std::map<std::string, std::string> values_;
};

}
