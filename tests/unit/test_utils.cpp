#include <gtest/gtest.h>
#include "chatvault/core/utils.hpp"
#include "chatvault/core/result.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace chatvault::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, CaseInsensitiveContains) {
    EXPECT_EQ(StringUtils::to_lower("Hello World"), "hello world");
    EXPECT_TRUE(StringUtils::contains_ignore_case("Quarterly_Report.PDF", "report"));
    EXPECT_TRUE(StringUtils::contains_ignore_case("notes.txt", ""));
    EXPECT_FALSE(StringUtils::contains_ignore_case("notes.txt", "backup"));
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(1048576), "1.00 MB");
    EXPECT_EQ(StringUtils::format_bytes(104857600), "100.00 MB");
}

TEST_F(StringUtilsTest, FormatDuration) {
    using std::chrono::milliseconds;
    EXPECT_EQ(StringUtils::format_duration(milliseconds(250)), "250ms");
    EXPECT_EQ(StringUtils::format_duration(milliseconds(42000)), "42s");
    EXPECT_EQ(StringUtils::format_duration(milliseconds(125000)), "2m 5s");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = "test_file.txt";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }

    std::string test_file;
};

TEST_F(FileUtilsTest, ExistsAndSize) {
    EXPECT_FALSE(FileUtils::exists(test_file));
    EXPECT_FALSE(FileUtils::file_size(test_file).has_value());

    std::ofstream file(test_file);
    file << "Hello, World!";
    file.close();

    EXPECT_TRUE(FileUtils::exists(test_file));
    auto size = FileUtils::file_size(test_file);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 13u);
}

TEST_F(FileUtilsTest, GetFileExtension) {
    EXPECT_EQ(FileUtils::get_file_extension("test.txt"), ".txt");
    EXPECT_EQ(FileUtils::get_file_extension("archive.tar.GZ"), ".gz");
    EXPECT_EQ(FileUtils::get_file_extension("README"), "");
}

TEST_F(FileUtilsTest, ExpandUser) {
    auto home = FileUtils::get_home_dir();
    EXPECT_EQ(FileUtils::expand_user("~"), home);
    EXPECT_EQ(FileUtils::expand_user("~/.chatvault.conf"), home / ".chatvault.conf");
    EXPECT_EQ(FileUtils::expand_user("/tmp/x"), std::filesystem::path("/tmp/x"));
    EXPECT_EQ(FileUtils::expand_user("~other/x"), std::filesystem::path("~other/x"));
}

TEST_F(FileUtilsTest, GuessMimeType) {
    EXPECT_EQ(FileUtils::guess_mime_type("photo.JPG").value_or(""), "image/jpeg");
    EXPECT_EQ(FileUtils::guess_mime_type("notes.txt").value_or(""), "text/plain");
    EXPECT_FALSE(FileUtils::guess_mime_type("data.unknownext").has_value());
}

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, UnixSecondsRoundTrip) {
    auto now = TimeUtils::now();
    auto seconds = TimeUtils::to_unix_seconds(now);
    auto back = TimeUtils::from_unix_seconds(seconds);

    auto drift = std::chrono::duration_cast<std::chrono::microseconds>(now - back).count();
    EXPECT_LE(std::abs(drift), 1);
    EXPECT_GT(seconds, 1.6e9);
}

TEST_F(TimeUtilsTest, FormatTimestamp) {
    auto timestamp = TimeUtils::format_timestamp(TimeUtils::now());

    EXPECT_EQ(timestamp.size(), 19u);
    EXPECT_NE(timestamp.find('-'), std::string::npos);
    EXPECT_NE(timestamp.find(':'), std::string::npos);
}

TEST(VaultResultTest, TruthinessAndDescription) {
    using chatvault::core::VaultError;
    using chatvault::core::VaultResult;

    VaultResult ok;
    EXPECT_TRUE(ok);

    VaultResult failure(VaultError::FILE_NOT_FOUND, "No file matches 'x'");
    EXPECT_FALSE(failure);
    EXPECT_NE(failure.describe().find("No file matches 'x'"), std::string::npos);

    auto limited = VaultResult::rate_limited(std::chrono::milliseconds(3000));
    EXPECT_EQ(limited.error, VaultError::RATE_LIMITED);
    EXPECT_EQ(limited.retry_after.count(), 3000);
}
