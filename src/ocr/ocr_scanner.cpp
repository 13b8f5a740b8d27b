#include "ocr_scanner.hpp"
#include "shared/digit_string.hpp"
#include <algorithm>
#include <unordered_set>

using bankgiro::shared::DigitString;

namespace duckdb {
namespace bankgiro {
namespace ocr {

std::vector<OcrMatch> OcrScanner::FindMatches(const std::string& text, const ScanOptions& options) {
    std::vector<OcrMatch> matches;
    // Every candidate tried so far, accepted or not
    std::unordered_set<std::string> tried;

    std::string digits = DigitString::JoinDigitRuns(text);
    int lower = std::max(options.min_length, 1);
    if (options.max_length < lower || digits.length() < static_cast<size_t>(lower)) {
        return matches;
    }
    size_t min_length = static_cast<size_t>(lower);
    size_t max_length = static_cast<size_t>(options.max_length);

    for (size_t start = 0; start + min_length <= digits.length(); start++) {
        size_t longest = std::min(max_length, digits.length() - start);

        for (size_t length = min_length; length <= longest; length++) {
            std::string candidate = digits.substr(start, length);
            if (!tried.insert(candidate).second) {
                continue;
            }

            std::string payload;
            if (OcrNumber::ToNumber(candidate, options, payload) != OcrResult::OK) {
                continue;
            }

            matches.push_back({candidate, payload});
        }
    }

    return matches;
}

std::vector<std::string> OcrScanner::FindAllInString(const std::string& text, const ScanOptions& options) {
    std::vector<std::string> result;
    for (const auto& match : FindMatches(text, options)) {
        result.push_back(match.ocr);
    }
    return result;
}

} // namespace ocr
} // namespace bankgiro
} // namespace duckdb
