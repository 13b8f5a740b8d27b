#pragma once

#include <string>
#include <cstdint>

namespace duckdb {
namespace bankgiro {
namespace ocr {

// Result codes for OCR generation and verification
enum class OcrResult {
    OK = 0,               // Valid number / generated successfully
    MUST_BE_NUMERIC = 1,  // Input (or pad) contains a non-digit
    OVERLONG_OCR = 2,     // Generated OCR exceeds MAX_LENGTH digits
    TOO_SHORT_OCR = 3,    // Too few digits for a payload digit, length and check digit
    BAD_CHECKSUM = 4,     // Check digit does not match
    BAD_LENGTH_DIGIT = 5, // Length digit does not match
    BAD_PADDING = 6       // Trailing payload digits are not the expected pad
};

struct OcrOptions {
    bool length_digit = false;
    std::string pad;
};

// Swedish OCR payment reference numbers
// Based on Bankgirot "Bankgiro Inbetalningar" user manual, section 5.2
//
// Layout: payload + pad + [length digit] + check digit
class OcrNumber {
public:
    static constexpr size_t MAX_LENGTH = 25;

    // Add pad, optional length digit and check digit to a number
    static OcrResult FromNumber(const std::string& number, const OcrOptions& options, std::string& ocr);
    static OcrResult FromNumber(uint64_t number, const OcrOptions& options, std::string& ocr);
    static OcrResult FromNumber(int64_t number, const OcrOptions& options, std::string& ocr);

    // Verify an OCR and strip check digit, length digit and pad
    static OcrResult ToNumber(const std::string& ocr, const OcrOptions& options, std::string& number);
    static OcrResult ToNumber(uint64_t ocr, const OcrOptions& options, std::string& number);
    static OcrResult ToNumber(int64_t ocr, const OcrOptions& options, std::string& number);

    // Same checks as ToNumber without producing the payload
    static OcrResult Validate(const std::string& ocr, const OcrOptions& options);

    // Mod-10 check digit (weights 2,1,2,1... from the right, cross sum of products).
    // digits must be ASCII digits only.
    static int CheckDigit(const std::string& digits);

    // Length digit for an OCR of total_length digits (including length and check digit)
    static int LengthDigit(size_t total_length);

    static const char* ResultName(OcrResult result);

private:
    static size_t MinimumLength(const OcrOptions& options);
};

} // namespace ocr
} // namespace bankgiro
} // namespace duckdb
