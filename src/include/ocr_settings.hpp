#pragma once

#include "ocr/ocr_scanner.hpp"
#include <mutex>
#include <string>

namespace duckdb {
namespace bankgiro {

// Defaults used by the SQL functions when a call omits OCR options
class OcrSettings {
public:
    static OcrSettings& GetInstance();

    static constexpr int DEFAULT_MIN_LENGTH = 4;
    static constexpr int DEFAULT_MAX_LENGTH = 18;

    // Throws std::invalid_argument for min_length < 2 or min_length > max_length.
    // max_length above OcrNumber::MAX_LENGTH is clamped.
    void SetScanBounds(int min_length, int max_length);
    int GetMinLength() const;
    int GetMaxLength() const;

    // Throws std::invalid_argument for a non-digit pad
    void SetFormat(bool length_digit, const std::string& pad);
    bool GetLengthDigit() const;
    std::string GetPad() const;

    // Snapshots of the current defaults
    ocr::OcrOptions GetOcrOptions() const;
    ocr::ScanOptions GetScanOptions() const;

    void Reset();

private:
    OcrSettings();
    OcrSettings(const OcrSettings&) = delete;
    OcrSettings& operator=(const OcrSettings&) = delete;

    mutable std::mutex lock_;
    ocr::ScanOptions options_;
};

} // namespace bankgiro
} // namespace duckdb
