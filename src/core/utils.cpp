#include "chatvault/core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace chatvault::core::utils {

std::string StringUtils::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();

    return start < end ? std::string(start, end) : std::string();
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool StringUtils::contains_ignore_case(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string StringUtils::format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();

    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }

    auto seconds = ms / 1000;
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }

    auto minutes = seconds / 60;
    seconds %= 60;

    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }

    auto hours = minutes / 60;
    minutes %= 60;

    return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::optional<uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

std::string FileUtils::get_file_extension(const std::filesystem::path& path) {
    return StringUtils::to_lower(path.extension().string());
}

std::filesystem::path FileUtils::get_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
    return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

std::filesystem::path FileUtils::expand_user(const std::string& path) {
    if (path == "~") {
        return get_home_dir();
    }
    if (path.size() > 1 && path[0] == '~' && path[1] == '/') {
        return get_home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

std::optional<std::string> FileUtils::guess_mime_type(const std::string& filename) {
    static const std::unordered_map<std::string, std::string> types = {
        {".txt", "text/plain"}, {".log", "text/plain"}, {".md", "text/markdown"},
        {".csv", "text/csv"}, {".html", "text/html"}, {".xml", "application/xml"},
        {".json", "application/json"}, {".pdf", "application/pdf"},
        {".zip", "application/zip"}, {".gz", "application/gzip"},
        {".tar", "application/x-tar"}, {".7z", "application/x-7z-compressed"},
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"},
        {".gif", "image/gif"}, {".webp", "image/webp"},
        {".mp3", "audio/mpeg"}, {".ogg", "audio/ogg"}, {".flac", "audio/flac"},
        {".mp4", "video/mp4"}, {".mkv", "video/x-matroska"}, {".webm", "video/webm"},
    };

    auto it = types.find(get_file_extension(filename));
    if (it == types.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::chrono::system_clock::time_point TimeUtils::now() {
    return std::chrono::system_clock::now();
}

double TimeUtils::to_unix_seconds(const std::chrono::system_clock::time_point& time) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch());
    return static_cast<double>(micros.count()) / 1e6;
}

std::chrono::system_clock::time_point TimeUtils::from_unix_seconds(double seconds) {
    auto micros = std::chrono::microseconds(static_cast<int64_t>(seconds * 1e6));
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(micros));
}

std::string TimeUtils::format_timestamp(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}
