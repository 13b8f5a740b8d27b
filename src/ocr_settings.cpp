#include "ocr_settings.hpp"
#include "shared/digit_string.hpp"
#include <iostream>
#include <stdexcept>

namespace duckdb {
namespace bankgiro {

constexpr int OcrSettings::DEFAULT_MIN_LENGTH;
constexpr int OcrSettings::DEFAULT_MAX_LENGTH;

OcrSettings::OcrSettings() {
    options_.min_length = DEFAULT_MIN_LENGTH;
    options_.max_length = DEFAULT_MAX_LENGTH;
}

OcrSettings& OcrSettings::GetInstance() {
    static OcrSettings instance;
    return instance;
}

void OcrSettings::SetScanBounds(int min_length, int max_length) {
    if (min_length < 2) {
        throw std::invalid_argument("min_length must be at least 2 (one payload digit and the check digit), got " +
                                    std::to_string(min_length));
    }
    if (min_length > max_length) {
        throw std::invalid_argument("min_length " + std::to_string(min_length) +
                                    " is greater than max_length " + std::to_string(max_length));
    }

    int limit = static_cast<int>(ocr::OcrNumber::MAX_LENGTH);
    if (max_length > limit) {
        std::cerr << "OCR max_length " << max_length << " exceeds " << limit << " digits, clamping" << std::endl;
        max_length = limit;
        if (min_length > max_length) {
            min_length = max_length;
        }
    }

    std::lock_guard<std::mutex> guard(lock_);
    options_.min_length = min_length;
    options_.max_length = max_length;
}

int OcrSettings::GetMinLength() const {
    std::lock_guard<std::mutex> guard(lock_);
    return options_.min_length;
}

int OcrSettings::GetMaxLength() const {
    std::lock_guard<std::mutex> guard(lock_);
    return options_.max_length;
}

void OcrSettings::SetFormat(bool length_digit, const std::string& pad) {
    if (!pad.empty() && !::bankgiro::shared::DigitString::IsDigitString(pad)) {
        throw std::invalid_argument("pad must contain digits only, got '" + pad + "'");
    }

    std::lock_guard<std::mutex> guard(lock_);
    options_.length_digit = length_digit;
    options_.pad = pad;
}

bool OcrSettings::GetLengthDigit() const {
    std::lock_guard<std::mutex> guard(lock_);
    return options_.length_digit;
}

std::string OcrSettings::GetPad() const {
    std::lock_guard<std::mutex> guard(lock_);
    return options_.pad;
}

ocr::OcrOptions OcrSettings::GetOcrOptions() const {
    std::lock_guard<std::mutex> guard(lock_);
    return options_;
}

ocr::ScanOptions OcrSettings::GetScanOptions() const {
    std::lock_guard<std::mutex> guard(lock_);
    return options_;
}

void OcrSettings::Reset() {
    std::lock_guard<std::mutex> guard(lock_);
    options_ = ocr::ScanOptions();
    options_.min_length = DEFAULT_MIN_LENGTH;
    options_.max_length = DEFAULT_MAX_LENGTH;
}

} // namespace bankgiro
} // namespace duckdb
