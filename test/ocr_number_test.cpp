#include "ocr/ocr_number.hpp"

#include <gtest/gtest.h>
#include <string>

using duckdb::bankgiro::ocr::OcrNumber;
using duckdb::bankgiro::ocr::OcrOptions;
using duckdb::bankgiro::ocr::OcrResult;

namespace {

OcrOptions Format(bool length_digit, const std::string &pad) {
    OcrOptions options;
    options.length_digit = length_digit;
    options.pad = pad;
    return options;
}

TEST(TestOcrCheckDigit, WeightsTwoOneFromTheRight)
{
    EXPECT_EQ(OcrNumber::CheckDigit("123"), 0);
    EXPECT_EQ(OcrNumber::CheckDigit("1234"), 4);
    EXPECT_EQ(OcrNumber::CheckDigit("456"), 4);
    EXPECT_EQ(OcrNumber::CheckDigit("0"), 0);

    // 9*2 = 18 contributes 1+8
    EXPECT_EQ(OcrNumber::CheckDigit("12345678902"), 3);
    EXPECT_EQ(OcrNumber::CheckDigit("9"), 1);
}

TEST(TestOcrCheckDigit, LengthDigitWrapsAtTen)
{
    EXPECT_EQ(OcrNumber::LengthDigit(4), 4);
    EXPECT_EQ(OcrNumber::LengthDigit(12), 2);
    EXPECT_EQ(OcrNumber::LengthDigit(20), 0);
}

TEST(TestOcrFromNumber, AddsCheckDigit)
{
    std::string ocr;
    EXPECT_EQ(OcrNumber::FromNumber("123", OcrOptions(), ocr), OcrResult::OK);
    EXPECT_EQ(ocr, "1230");
}

TEST(TestOcrFromNumber, AcceptsIntegers)
{
    std::string ocr;
    EXPECT_EQ(OcrNumber::FromNumber(static_cast<uint64_t>(123), OcrOptions(), ocr), OcrResult::OK);
    EXPECT_EQ(ocr, "1230");

    ocr.clear();
    EXPECT_EQ(OcrNumber::FromNumber(static_cast<int64_t>(123), OcrOptions(), ocr), OcrResult::OK);
    EXPECT_EQ(ocr, "1230");

    EXPECT_EQ(OcrNumber::FromNumber(static_cast<int64_t>(-123), OcrOptions(), ocr), OcrResult::MUST_BE_NUMERIC);
}

TEST(TestOcrFromNumber, AddsLengthDigit)
{
    std::string ocr;
    EXPECT_EQ(OcrNumber::FromNumber("1234567890", Format(true, ""), ocr), OcrResult::OK);
    EXPECT_EQ(ocr, "123456789023");
}

TEST(TestOcrFromNumber, AppendsPadBeforeLengthDigit)
{
    std::string ocr;
    EXPECT_EQ(OcrNumber::FromNumber("1234567890", Format(true, "0"), ocr), OcrResult::OK);
    EXPECT_EQ(ocr, "1234567890037");

    EXPECT_EQ(OcrNumber::FromNumber("123", Format(false, "000"), ocr), OcrResult::OK);
    EXPECT_EQ(ocr, "1230002");
}

TEST(TestOcrFromNumber, RejectsOverlongResult)
{
    std::string ocr = "untouched";
    EXPECT_EQ(OcrNumber::FromNumber("1234567890123456789012345", OcrOptions(), ocr), OcrResult::OVERLONG_OCR);
    EXPECT_EQ(ocr, "untouched");

    // 24 digits + check digit is exactly the limit
    EXPECT_EQ(OcrNumber::FromNumber("123456789012345678901234", OcrOptions(), ocr), OcrResult::OK);
    EXPECT_EQ(ocr.length(), OcrNumber::MAX_LENGTH);

    // Pad and length digit count towards the limit
    EXPECT_EQ(OcrNumber::FromNumber("1234567890123456789012", Format(true, "00"), ocr), OcrResult::OVERLONG_OCR);
}

TEST(TestOcrFromNumber, RejectsNonNumericInput)
{
    std::string ocr;
    EXPECT_EQ(OcrNumber::FromNumber("garbage", OcrOptions(), ocr), OcrResult::MUST_BE_NUMERIC);
    EXPECT_EQ(OcrNumber::FromNumber("", OcrOptions(), ocr), OcrResult::MUST_BE_NUMERIC);
    EXPECT_EQ(OcrNumber::FromNumber("12 3", OcrOptions(), ocr), OcrResult::MUST_BE_NUMERIC);
    EXPECT_EQ(OcrNumber::FromNumber("123", Format(false, "x"), ocr), OcrResult::MUST_BE_NUMERIC);
}

TEST(TestOcrToNumber, StripsCheckDigit)
{
    std::string number;
    EXPECT_EQ(OcrNumber::ToNumber("1230", OcrOptions(), number), OcrResult::OK);
    EXPECT_EQ(number, "123");

    number.clear();
    EXPECT_EQ(OcrNumber::ToNumber(static_cast<int64_t>(1230), OcrOptions(), number), OcrResult::OK);
    EXPECT_EQ(number, "123");
}

TEST(TestOcrToNumber, StripsLengthDigitAndPad)
{
    std::string number;
    EXPECT_EQ(OcrNumber::ToNumber("123456789023", Format(true, ""), number), OcrResult::OK);
    EXPECT_EQ(number, "1234567890");

    EXPECT_EQ(OcrNumber::ToNumber("1234567890037", Format(true, "0"), number), OcrResult::OK);
    EXPECT_EQ(number, "1234567890");
}

TEST(TestOcrToNumber, RejectsTooShortInput)
{
    std::string number;
    EXPECT_EQ(OcrNumber::ToNumber("0", OcrOptions(), number), OcrResult::TOO_SHORT_OCR);
    EXPECT_EQ(OcrNumber::ToNumber("00", OcrOptions(), number), OcrResult::OK);
    EXPECT_EQ(number, "0");

    // Length digit needs a third digit
    EXPECT_EQ(OcrNumber::ToNumber("00", Format(true, ""), number), OcrResult::TOO_SHORT_OCR);
    EXPECT_EQ(OcrNumber::ToNumber("0", Format(false, "0"), number), OcrResult::TOO_SHORT_OCR);
}

TEST(TestOcrToNumber, PadDoesNotRaiseMinimumLength)
{
    std::string number = "untouched";
    EXPECT_EQ(OcrNumber::ToNumber("1230", Format(false, "000"), number), OcrResult::BAD_PADDING);
    EXPECT_EQ(OcrNumber::ToNumber("02", Format(false, "0"), number), OcrResult::BAD_CHECKSUM);
    EXPECT_EQ(number, "untouched");

    // The pad may take up the whole payload
    EXPECT_EQ(OcrNumber::ToNumber("00", Format(false, "0"), number), OcrResult::OK);
    EXPECT_EQ(number, "");

    // Fewer digits than the pad left after stripping the check digit
    EXPECT_EQ(OcrNumber::ToNumber("00", Format(false, "000"), number), OcrResult::BAD_PADDING);
}

TEST(TestOcrToNumber, RejectsBadChecksum)
{
    std::string number;
    EXPECT_EQ(OcrNumber::ToNumber("1231", OcrOptions(), number), OcrResult::BAD_CHECKSUM);
}

TEST(TestOcrToNumber, RejectsBadLengthDigit)
{
    std::string number;
    EXPECT_EQ(OcrNumber::ToNumber("12369", Format(true, ""), number), OcrResult::BAD_LENGTH_DIGIT);
}

TEST(TestOcrToNumber, ChecksPadding)
{
    std::string number;
    EXPECT_EQ(OcrNumber::ToNumber("1230", Format(false, ""), number), OcrResult::OK);
    EXPECT_EQ(number, "123");
    EXPECT_EQ(OcrNumber::ToNumber("12302", Format(false, "0"), number), OcrResult::OK);
    EXPECT_EQ(number, "123");
    EXPECT_EQ(OcrNumber::ToNumber("1230002", Format(false, "000"), number), OcrResult::OK);
    EXPECT_EQ(number, "123");

    EXPECT_EQ(OcrNumber::ToNumber("12344", Format(false, "0"), number), OcrResult::BAD_PADDING);

    // A non-digit pad can never match
    EXPECT_EQ(OcrNumber::ToNumber("1230", Format(false, "x"), number), OcrResult::BAD_PADDING);
    EXPECT_EQ(OcrNumber::Validate("1230", Format(false, "x")), OcrResult::BAD_PADDING);
}

TEST(TestOcrToNumber, RejectsNonNumericInput)
{
    std::string number;
    EXPECT_EQ(OcrNumber::ToNumber("garbage", OcrOptions(), number), OcrResult::MUST_BE_NUMERIC);
    EXPECT_EQ(OcrNumber::ToNumber("12 30", OcrOptions(), number), OcrResult::MUST_BE_NUMERIC);
    EXPECT_EQ(OcrNumber::ToNumber(static_cast<int64_t>(-1230), OcrOptions(), number), OcrResult::MUST_BE_NUMERIC);
}

TEST(TestOcrToNumber, ReversesFromNumberForAllPayloadLengths)
{
    const std::string digits = "9876543210987654321098";
    const OcrOptions formats[] = {Format(false, ""), Format(true, ""), Format(false, "0"), Format(true, "0")};

    for (size_t length = 1; length <= digits.length(); length++) {
        std::string payload = digits.substr(0, length);
        for (const auto &format : formats) {
            std::string ocr;
            ASSERT_EQ(OcrNumber::FromNumber(payload, format, ocr), OcrResult::OK) << payload;

            std::string number;
            ASSERT_EQ(OcrNumber::ToNumber(ocr, format, number), OcrResult::OK) << ocr;
            EXPECT_EQ(number, payload);
        }
    }
}

TEST(TestOcrValidate, ReportsResultKinds)
{
    EXPECT_EQ(OcrNumber::Validate("1230", OcrOptions()), OcrResult::OK);
    EXPECT_EQ(OcrNumber::Validate("1231", OcrOptions()), OcrResult::BAD_CHECKSUM);
    EXPECT_STREQ(OcrNumber::ResultName(OcrNumber::Validate("12369", Format(true, ""))), "BadLengthDigit");
    EXPECT_STREQ(OcrNumber::ResultName(OcrResult::MUST_BE_NUMERIC), "MustBeNumeric");
    EXPECT_STREQ(OcrNumber::ResultName(OcrResult::OVERLONG_OCR), "OverlongOCR");
    EXPECT_STREQ(OcrNumber::ResultName(OcrResult::TOO_SHORT_OCR), "TooShortOCR");
    EXPECT_STREQ(OcrNumber::ResultName(OcrResult::BAD_PADDING), "BadPadding");
}

} // namespace
