/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include "pubid/utils/string_utils.h"
#include <climits>

using namespace pubid::utils;

class StringUtilsTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// toLowerCase / toUpperCase tests
TEST_F(StringUtilsTest, ToLowerCase_Mixed) {
    EXPECT_EQ(toLowerCase("NIST Sp 800"), "nist sp 800");
}

TEST_F(StringUtilsTest, ToLowerCase_Empty) {
    EXPECT_EQ(toLowerCase(""), "");
}

TEST_F(StringUtilsTest, ToUpperCase_Mixed) {
    EXPECT_EQ(toUpperCase("esp"), "ESP");
    EXPECT_EQ(toUpperCase("Fips.Pub"), "FIPS.PUB");
}

// trim tests
TEST_F(StringUtilsTest, Trim_LeadingAndTrailing) {
    EXPECT_EQ(trim("  NIST SP 800-53\t\n"), "NIST SP 800-53");
}

TEST_F(StringUtilsTest, Trim_InnerSpacesKept) {
    EXPECT_EQ(trim("FIPS  PUB"), "FIPS  PUB");
}

TEST_F(StringUtilsTest, Trim_AllWhitespace) {
    EXPECT_EQ(trim(" \t "), "");
}

// join tests
TEST_F(StringUtilsTest, Join_Basic) {
    EXPECT_EQ(join({"FIPS", "PUB"}, " "), "FIPS PUB");
    EXPECT_EQ(join({}, ","), "");
}

// startsWith tests
TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(startsWith("Addendum to", "Addendum"));
    EXPECT_FALSE(startsWith("Add", "Addendum"));
    EXPECT_FALSE(startsWith("addendum to", "Addendum"));
}

// replaceAll tests
TEST_F(StringUtilsTest, ReplaceAll) {
    EXPECT_EQ(replaceAll("FIPS PUB X", " ", "."), "FIPS.PUB.X");
    EXPECT_EQ(replaceAll("abc", "", "x"), "abc");
}

// normalizeKey tests
TEST_F(StringUtilsTest, NormalizeKey_DropsPunctuation) {
    EXPECT_EQ(normalizeKey("fips.pub"), "FIPSPUB");
    EXPECT_EQ(normalizeKey("FIPS PUB"), "FIPSPUB");
    EXPECT_EQ(normalizeKey("crpl-f-b"), "CRPLFB");
}

TEST_F(StringUtilsTest, NormalizeKey_Empty) {
    EXPECT_EQ(normalizeKey("-. "), "");
}

// parseNonNegativeInt tests
TEST_F(StringUtilsTest, ParseNonNegativeInt_Valid) {
    EXPECT_EQ(parseNonNegativeInt("0"), 0);
    EXPECT_EQ(parseNonNegativeInt("053"), 53);
}

TEST_F(StringUtilsTest, ParseNonNegativeInt_Invalid) {
    EXPECT_FALSE(parseNonNegativeInt("").has_value());
    EXPECT_FALSE(parseNonNegativeInt("-1").has_value());
    EXPECT_FALSE(parseNonNegativeInt("5a").has_value());
}

TEST_F(StringUtilsTest, ParseNonNegativeInt_Overflow) {
    EXPECT_EQ(parseNonNegativeInt(std::to_string(INT_MAX)), INT_MAX);
    EXPECT_FALSE(parseNonNegativeInt("99999999999").has_value());
}

// countDigits tests
TEST_F(StringUtilsTest, CountDigits) {
    EXPECT_EQ(countDigits("800-53"), 3u);
    EXPECT_EQ(countDigits("r45x", 1), 2u);
    EXPECT_EQ(countDigits("abc"), 0u);
    EXPECT_EQ(countDigits("12", 5), 0u);
}
