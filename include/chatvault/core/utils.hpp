#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chatvault::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool contains_ignore_case(const std::string& haystack, const std::string& needle);
    static std::string format_bytes(uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<uint64_t> file_size(const std::filesystem::path& path);

    // Lower-cased last extension including the dot, "" when there is none.
    static std::string get_file_extension(const std::filesystem::path& path);

    static std::filesystem::path get_home_dir();
    static std::filesystem::path expand_user(const std::string& path);

    static std::optional<std::string> guess_mime_type(const std::string& filename);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();

    // Fractional seconds since the Unix epoch, the representation used in persisted records.
    static double to_unix_seconds(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_unix_seconds(double seconds);

    static std::string format_timestamp(const std::chrono::system_clock::time_point& time);
};

}
