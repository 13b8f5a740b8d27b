#include "shared/digit_string.hpp"

#include <gtest/gtest.h>
#include <cstdint>
#include <limits>

using bankgiro::shared::DigitString;

namespace {

TEST(TestDigitString, ClassifiesAsciiDigitsOnly)
{
    EXPECT_TRUE(DigitString::IsDigitChar('0'));
    EXPECT_TRUE(DigitString::IsDigitChar('9'));
    EXPECT_FALSE(DigitString::IsDigitChar('a'));
    EXPECT_FALSE(DigitString::IsDigitChar(' '));
    EXPECT_FALSE(DigitString::IsDigitChar('\xd9')); // lead byte of Arabic-Indic digits

    EXPECT_TRUE(DigitString::IsDigitString("0"));
    EXPECT_TRUE(DigitString::IsDigitString("1234567890123456789012345"));
    EXPECT_FALSE(DigitString::IsDigitString(""));
    EXPECT_FALSE(DigitString::IsDigitString("12a3"));
    EXPECT_FALSE(DigitString::IsDigitString("-123"));
    EXPECT_FALSE(DigitString::IsDigitString(" 123"));
}

TEST(TestDigitString, ExtractsMaximalRuns)
{
    EXPECT_EQ(DigitString::ExtractDigitRuns("12;30.4564"), std::vector<std::string>({"12", "30", "4564"}));
    EXPECT_EQ(DigitString::ExtractDigitRuns("x1230x"), std::vector<std::string>({"1230"}));
    EXPECT_EQ(DigitString::ExtractDigitRuns("1230"), std::vector<std::string>({"1230"}));
    EXPECT_TRUE(DigitString::ExtractDigitRuns("").empty());
    EXPECT_TRUE(DigitString::ExtractDigitRuns("no digits").empty());
}

TEST(TestDigitString, JoinsRunsDroppingNonDigits)
{
    EXPECT_EQ(DigitString::JoinDigitRuns("12\n30\n4564"), "12304564");
    EXPECT_EQ(DigitString::JoinDigitRuns("EUR 17,18"), "1718");
    EXPECT_EQ(DigitString::JoinDigitRuns("none"), "");
}

TEST(TestDigitString, FormatsIntegers)
{
    EXPECT_EQ(DigitString::FromInteger(static_cast<uint64_t>(1230)), "1230");
    EXPECT_EQ(DigitString::FromInteger(std::numeric_limits<uint64_t>::max()), "18446744073709551615");
    EXPECT_EQ(DigitString::FromInteger(static_cast<int64_t>(0)), "0");
    EXPECT_EQ(DigitString::FromInteger(static_cast<int64_t>(-42)), "-42");
}

} // namespace
