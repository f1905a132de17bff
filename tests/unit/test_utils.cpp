#include <gtest/gtest.h>
#include "lcars/core/utils.hpp"
#include <filesystem>
#include <fstream>

using namespace lcars::core::utils;
using namespace std::chrono_literals;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Split) {
    auto result = StringUtils::split("10.0.0.2/32,fd00::2/128", ',');
    ASSERT_EQ(result.size(), 2);
    EXPECT_EQ(result[0], "10.0.0.2/32");
    EXPECT_EQ(result[1], "fd00::2/128");

    auto empty = StringUtils::split("", ',');
    EXPECT_TRUE(empty.empty());
}

TEST_F(StringUtilsTest, Join) {
    EXPECT_EQ(StringUtils::join({"ip", "link", "add"}, " "), "ip link add");
    EXPECT_EQ(StringUtils::join({}, ","), "");
}

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  wg0 \t"), "wg0");
    EXPECT_EQ(StringUtils::trim("wg0"), "wg0");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, Prefix) {
    EXPECT_TRUE(StringUtils::starts_with("magnet:?xt=urn:btih:", "magnet:"));
    EXPECT_FALSE(StringUtils::starts_with("mag", "magnet:"));
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(100ULL * 1024 * 1024), "100.00 MB");
}

TEST_F(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(StringUtils::format_duration(250ms), "250ms");
    EXPECT_EQ(StringUtils::format_duration(30s), "30s");
    EXPECT_EQ(StringUtils::format_duration(5min + 3s), "5m 3s");
    EXPECT_EQ(StringUtils::format_duration(48h), "48h 0m");
}

TEST_F(StringUtilsTest, Hex) {
    const uint8_t bytes[] = {0x00, 0x4c, 0xff};
    EXPECT_EQ(StringUtils::to_hex(bytes, sizeof(bytes)), "004cff");
    EXPECT_TRUE(StringUtils::is_hex("DEADbeef01"));
    EXPECT_FALSE(StringUtils::is_hex("xyz"));
    EXPECT_FALSE(StringUtils::is_hex(""));
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "lcars_file_utils_test";
        std::filesystem::remove_all(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

TEST_F(FileUtilsTest, CreateDirectories) {
    auto nested = test_dir / "a" / "b";
    EXPECT_FALSE(FileUtils::exists(nested));
    EXPECT_TRUE(FileUtils::create_directories(nested));
    EXPECT_TRUE(FileUtils::exists(nested));

    // Already present
    EXPECT_TRUE(FileUtils::create_directories(nested));
}

TEST_F(FileUtilsTest, AvailableSpace) {
    ASSERT_TRUE(FileUtils::create_directories(test_dir));
    auto space = FileUtils::available_space(test_dir);
    ASSERT_TRUE(space.has_value());
    EXPECT_GT(*space, 0u);

    EXPECT_FALSE(FileUtils::available_space(test_dir / "missing").has_value());
}

TEST_F(FileUtilsTest, ReadAndWriteText) {
    ASSERT_TRUE(FileUtils::create_directories(test_dir));
    auto path = test_dir / "resolv.conf";

    EXPECT_FALSE(FileUtils::read_text(path).has_value());
    ASSERT_TRUE(FileUtils::write_text(path, "nameserver 10.0.0.1\n"));
    EXPECT_EQ(FileUtils::read_text(path), "nameserver 10.0.0.1\n");

    // Rewriting truncates
    ASSERT_TRUE(FileUtils::write_text(path, "x"));
    EXPECT_EQ(FileUtils::read_text(path), "x");

    EXPECT_FALSE(FileUtils::write_text(test_dir / "missing" / "file", "x"));
}

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, IsoString) {
    auto epoch = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    EXPECT_EQ(TimeUtils::to_iso_string(epoch), "2023-11-14T22:13:20Z");
}

TEST_F(TimeUtilsTest, ParseDuration) {
    EXPECT_EQ(TimeUtils::parse_duration("250ms"), 250ms);
    EXPECT_EQ(TimeUtils::parse_duration("30s"), 30s);
    EXPECT_EQ(TimeUtils::parse_duration("30"), 30s);
    EXPECT_EQ(TimeUtils::parse_duration("5m"), 5min);
    EXPECT_EQ(TimeUtils::parse_duration(" 48h "), 48h);
    EXPECT_EQ(TimeUtils::parse_duration("48H"), 48h);
}

TEST_F(TimeUtilsTest, ParseDurationRejectsGarbage) {
    EXPECT_FALSE(TimeUtils::parse_duration("").has_value());
    EXPECT_FALSE(TimeUtils::parse_duration("fast").has_value());
    EXPECT_FALSE(TimeUtils::parse_duration("-5s").has_value());
    EXPECT_FALSE(TimeUtils::parse_duration("5 days").has_value());
}

TEST_F(TimeUtilsTest, ParseDurationRejectsOverflow) {
    EXPECT_FALSE(TimeUtils::parse_duration("9223372036854775807h").has_value());
    EXPECT_FALSE(TimeUtils::parse_duration("9223372036854775807s").has_value());
    EXPECT_FALSE(TimeUtils::parse_duration("99999999999999999999999ms").has_value());
    EXPECT_EQ(TimeUtils::parse_duration("9223372036854775807ms"), std::chrono::milliseconds::max());
    EXPECT_EQ(TimeUtils::parse_duration("2562047788015h"), std::chrono::hours(2562047788015));
}
