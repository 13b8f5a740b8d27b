#include "ocr_number.hpp"
#include "shared/digit_string.hpp"

using bankgiro::shared::DigitString;

namespace duckdb {
namespace bankgiro {
namespace ocr {

constexpr size_t OcrNumber::MAX_LENGTH;

int OcrNumber::CheckDigit(const std::string& digits) {
    int sum = 0;
    int weight = 2;

    // Rightmost digit gets weight 2, then alternate 1, 2, 1, ...
    for (size_t i = digits.length(); i > 0; i--) {
        int digit = digits[i - 1] - '0';
        int weighted = digit * weight;

        // Cross-sum: 16 becomes 1+6=7
        if (weighted >= 10) {
            sum += (weighted / 10) + (weighted % 10);
        } else {
            sum += weighted;
        }

        weight = (weight == 2) ? 1 : 2;
    }

    return (10 - (sum % 10)) % 10;
}

int OcrNumber::LengthDigit(size_t total_length) {
    return static_cast<int>(total_length % 10);
}

size_t OcrNumber::MinimumLength(const OcrOptions& options) {
    // One digit before the optional length digit and the check digit
    return 1 + (options.length_digit ? 1 : 0) + 1;
}

OcrResult OcrNumber::FromNumber(const std::string& number, const OcrOptions& options, std::string& ocr) {
    if (!DigitString::IsDigitString(number)) {
        return OcrResult::MUST_BE_NUMERIC;
    }
    if (!options.pad.empty() && !DigitString::IsDigitString(options.pad)) {
        return OcrResult::MUST_BE_NUMERIC;
    }

    std::string result = number + options.pad;

    if (options.length_digit) {
        // Counts itself and the check digit
        result += static_cast<char>('0' + LengthDigit(result.length() + 2));
    }

    result += static_cast<char>('0' + CheckDigit(result));

    if (result.length() > MAX_LENGTH) {
        return OcrResult::OVERLONG_OCR;
    }

    ocr = result;
    return OcrResult::OK;
}

OcrResult OcrNumber::FromNumber(uint64_t number, const OcrOptions& options, std::string& ocr) {
    return FromNumber(DigitString::FromInteger(number), options, ocr);
}

OcrResult OcrNumber::FromNumber(int64_t number, const OcrOptions& options, std::string& ocr) {
    return FromNumber(DigitString::FromInteger(number), options, ocr);
}

OcrResult OcrNumber::ToNumber(const std::string& ocr, const OcrOptions& options, std::string& number) {
    if (!DigitString::IsDigitString(ocr)) {
        return OcrResult::MUST_BE_NUMERIC;
    }

    if (ocr.length() < MinimumLength(options)) {
        return OcrResult::TOO_SHORT_OCR;
    }

    // Check digit at the last position
    std::string body = ocr.substr(0, ocr.length() - 1);
    int expected = ocr[ocr.length() - 1] - '0';
    if (CheckDigit(body) != expected) {
        return OcrResult::BAD_CHECKSUM;
    }

    // Length digit directly before the check digit
    if (options.length_digit) {
        int length_digit = body[body.length() - 1] - '0';
        if (LengthDigit(ocr.length()) != length_digit) {
            return OcrResult::BAD_LENGTH_DIGIT;
        }
        body.pop_back();
    }

    // A pad that is not made of digits never matches
    if (!options.pad.empty()) {
        if (body.length() < options.pad.length()) {
            return OcrResult::BAD_PADDING;
        }
        size_t pad_start = body.length() - options.pad.length();
        if (body.compare(pad_start, std::string::npos, options.pad) != 0) {
            return OcrResult::BAD_PADDING;
        }
        body.erase(pad_start);
    }

    number = body;
    return OcrResult::OK;
}

OcrResult OcrNumber::ToNumber(uint64_t ocr, const OcrOptions& options, std::string& number) {
    return ToNumber(DigitString::FromInteger(ocr), options, number);
}

OcrResult OcrNumber::ToNumber(int64_t ocr, const OcrOptions& options, std::string& number) {
    return ToNumber(DigitString::FromInteger(ocr), options, number);
}

OcrResult OcrNumber::Validate(const std::string& ocr, const OcrOptions& options) {
    std::string ignored;
    return ToNumber(ocr, options, ignored);
}

const char* OcrNumber::ResultName(OcrResult result) {
    switch (result) {
        case OcrResult::OK:
            return "OK";
        case OcrResult::MUST_BE_NUMERIC:
            return "MustBeNumeric";
        case OcrResult::OVERLONG_OCR:
            return "OverlongOCR";
        case OcrResult::TOO_SHORT_OCR:
            return "TooShortOCR";
        case OcrResult::BAD_CHECKSUM:
            return "BadChecksum";
        case OcrResult::BAD_LENGTH_DIGIT:
            return "BadLengthDigit";
        case OcrResult::BAD_PADDING:
            return "BadPadding";
        default:
            return "UNKNOWN";
    }
}

} // namespace ocr
} // namespace bankgiro
} // namespace duckdb
