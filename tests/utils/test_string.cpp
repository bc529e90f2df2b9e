#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

#include "vigil/utils/string.hpp"

using namespace vigil::utils;

TEST(StringUtilsTest, TrimAndCase) {
    EXPECT_EQ(trim("  padded \t\n"), "padded");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(toLower("MiXeD 123"), "mixed 123");
    EXPECT_EQ(toUpper("MiXeD 123"), "MIXED 123");
}

TEST(StringUtilsTest, CollapseWhitespace) {
    EXPECT_EQ(collapseWhitespace("  a \t\n b   c  "), "a b c");
    EXPECT_EQ(collapseWhitespace(""), "");
    EXPECT_EQ(collapseWhitespace(collapseWhitespace(" x  y ")), "x y");
}

TEST(StringUtilsTest, DigitsOnly) {
    EXPECT_EQ(digitsOnly("529.982.247-25"), "52998224725");
    EXPECT_EQ(digitsOnly("no digits"), "");
}

TEST(StringUtilsTest, CaseInsensitiveSearch) {
    EXPECT_TRUE(iequals("SCRIPT", "script"));
    EXPECT_FALSE(iequals("script", "scripts"));
    EXPECT_EQ(ifind("a JavaScript: b", "javascript:"), 2U);
    EXPECT_EQ(ifind("abcABC", "abc", 1), 3U);
    EXPECT_EQ(ifind("abc", "xyz"), std::string_view::npos);
}

TEST(StringUtilsTest, Join) {
    std::vector<std::string> parts{"a", "b", "c"};
    EXPECT_EQ(joinStrings(parts, ", "), "a, b, c");
    EXPECT_EQ(joinStrings({}, ", "), "");
}

TEST(StringUtilsTest, Utf8) {
    EXPECT_EQ(utf8Truncate("héllo world", 5), "héllo");
    EXPECT_EQ(utf8Truncate("short", 10), "short");
    EXPECT_EQ(utf8Truncate("日本語", 2), "日本");
}

TEST(StringUtilsTest, FormatNumberAndQuote) {
    EXPECT_EQ(formatNumber(3), "3");
    EXPECT_EQ(formatNumber(-0.5), "-0.5");
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::quiet_NaN()), "NaN");
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::infinity()),
              "Infinity");
    EXPECT_EQ(quote("say \"hi\"\n"), "\"say \\\"hi\\\"\\n\"");
}
