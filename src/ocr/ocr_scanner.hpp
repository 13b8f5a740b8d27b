#pragma once

#include "ocr_number.hpp"
#include <string>
#include <vector>

namespace duckdb {
namespace bankgiro {
namespace ocr {

struct ScanOptions : public OcrOptions {
    // Bounds on the total OCR length (payload + pad + length digit + check digit)
    int min_length = 4;
    int max_length = 18;
};

struct OcrMatch {
    std::string ocr;
    std::string payload;
};

// Finds OCR numbers in free text such as bank statement lines.
//
// Non-digits are treated as noise: digit runs are joined and every window
// between min_length and max_length digits is tried, so references that were
// split by separators or smushed against amounts and item numbers are found.
// Overlapping matches are all reported; each distinct OCR appears once, in
// order of first occurrence.
class OcrScanner {
public:
    static std::vector<std::string> FindAllInString(const std::string& text, const ScanOptions& options);

    static std::vector<OcrMatch> FindMatches(const std::string& text, const ScanOptions& options);
};

} // namespace ocr
} // namespace bankgiro
} // namespace duckdb
