/**
 * @file test_string_utils.cpp
 * @brief String helpers used by the config loader and runtime parsers
 *
 * @date 2025
 */

#include "saferun/utils/string_utils.hpp"

#include <gtest/gtest.h>

using saferun::utils::StringUtils;

TEST(StringUtilsTest, TrimAndSplit) {
    EXPECT_EQ(StringUtils::Trim("  \tabc \n"), "abc");
    EXPECT_EQ(StringUtils::Trim("   "), "");
    EXPECT_EQ(StringUtils::Split("a,b,,c", ','), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(StringUtils::SplitWhitespace(" 12.5MiB  /  1GiB "),
              (std::vector<std::string>{"12.5MiB", "/", "1GiB"}));
    EXPECT_EQ(StringUtils::Join({"x", "y", "z"}, ", "), "x, y, z");
}

TEST(StringUtilsTest, WildcardMatchIsCaseInsensitive) {
    EXPECT_TRUE(StringUtils::WildcardMatch("*.malware.com", "CDN.Malware.com"));
    EXPECT_FALSE(StringUtils::WildcardMatch("*.malware.com", "malware.com"));
    EXPECT_TRUE(StringUtils::WildcardMatch("nc", "NC"));
    EXPECT_FALSE(StringUtils::WildcardMatch("nc", "ncat"));
    EXPECT_TRUE(StringUtils::WildcardMatch("n?ap", "nmap"));
    EXPECT_TRUE(StringUtils::WildcardMatch("*scan*", "masscanner"));
    EXPECT_TRUE(StringUtils::WildcardMatch("*", ""));
}

TEST(StringUtilsTest, TruncateKeepsSuffixWithinLimit) {
    EXPECT_EQ(StringUtils::Truncate("short", 10), "short");
    EXPECT_EQ(StringUtils::Truncate("abcdefghij", 6), "abc...");
    EXPECT_EQ(StringUtils::Truncate("abcdefghij", 2), "ab");
}

TEST(StringUtilsTest, ParsesRuntimeSizes) {
    EXPECT_EQ(StringUtils::ParseSizeBytes("12B"), 12u);
    EXPECT_EQ(StringUtils::ParseSizeBytes("1KiB"), 1024u);
    EXPECT_EQ(StringUtils::ParseSizeBytes("12.5MiB"), 13107200u);
    EXPECT_EQ(StringUtils::ParseSizeBytes("1.5GB"), 1500000000u);
    EXPECT_EQ(StringUtils::ParseSizeBytes("900kB"), 900000u);
    EXPECT_FALSE(StringUtils::ParseSizeBytes("--").has_value());
    EXPECT_FALSE(StringUtils::ParseSizeBytes("12 parsecs").has_value());
}

TEST(StringUtilsTest, ParsesNumbers) {
    EXPECT_DOUBLE_EQ(*StringUtils::ParseDouble("42.5%"), 42.5);
    EXPECT_DOUBLE_EQ(*StringUtils::ParseDouble(" 0.25 "), 0.25);
    EXPECT_FALSE(StringUtils::ParseDouble("lots").has_value());
    EXPECT_FALSE(StringUtils::ParseDouble("").has_value());

    EXPECT_EQ(StringUtils::ParseInt("-17"), -17);
    EXPECT_FALSE(StringUtils::ParseInt("17x").has_value());
}
