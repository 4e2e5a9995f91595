#include <cmath>
#include <cstdint>
#include <gtest/gtest.h>
#include <optional>
#include <solranklib/string_transform.hh>

// NOLINTNEXTLINE
TEST(string_transform, str2num_integers) {
    EXPECT_EQ(str2num<int>("123"), 123);
    EXPECT_EQ(str2num<int>("+5"), 5);
    EXPECT_EQ(str2num<int>("-5"), -5);
    EXPECT_EQ(str2num<unsigned>("-5"), std::nullopt);
    EXPECT_EQ(str2num<int>(""), std::nullopt);
    EXPECT_EQ(str2num<int>("12a"), std::nullopt);
    EXPECT_EQ(str2num<int>(" 12"), std::nullopt);
    EXPECT_EQ(str2num<uint8_t>("256"), std::nullopt);
    EXPECT_EQ(str2num<uint64_t>("18446744073709551615"), UINT64_MAX);
}

// NOLINTNEXTLINE
TEST(string_transform, str2num_floats) {
    EXPECT_EQ(str2num<double>("0.25"), 0.25);
    EXPECT_EQ(str2num<double>("-1e3"), -1000.0);
    EXPECT_EQ(str2num<double>("inf"), INFINITY);
    EXPECT_EQ(str2num<double>(""), std::nullopt);
    EXPECT_EQ(str2num<double>(" 1"), std::nullopt);
    EXPECT_EQ(str2num<double>("1.5x"), std::nullopt);
}

// NOLINTNEXTLINE
TEST(string_transform, str2num_bool) {
    EXPECT_EQ(str2num<bool>("1"), true);
    EXPECT_EQ(str2num<bool>("0"), false);
    EXPECT_EQ(str2num<bool>("true"), std::nullopt);
}

// NOLINTNEXTLINE
TEST(string_transform, trim) {
    EXPECT_EQ(trim("  \t abc d \n\r"), "abc d");
    EXPECT_EQ(trim(" \n "), "");
    EXPECT_EQ(trim("x"), "x");
}

// NOLINTNEXTLINE
TEST(string_transform, has_prefix_and_lower_equal) {
    EXPECT_TRUE(has_prefix("prompt text", "prompt"));
    EXPECT_TRUE(has_prefix("abc", ""));
    EXPECT_FALSE(has_prefix("ab", "abc"));
    EXPECT_TRUE(lower_equal("TrUe", "true"));
    EXPECT_FALSE(lower_equal("true", "truee"));
}

// NOLINTNEXTLINE
TEST(string_transform, to_string_with_precision) {
    EXPECT_EQ(to_string(1.0 / 3, 2), "0.33");
    EXPECT_EQ(to_string(2.0, 2), "2.00");
    EXPECT_EQ(to_string(0.125, 2), "0.12");
    EXPECT_EQ(to_string(0.875, 2), "0.88");
    EXPECT_EQ(to_string(12.3456, 0), "12");
}
