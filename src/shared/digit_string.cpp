#include "shared/digit_string.hpp"
#include <algorithm>

namespace bankgiro {
namespace shared {

bool DigitString::IsDigitChar(char c) {
    return c >= '0' && c <= '9';
}

bool DigitString::IsDigitString(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    return std::all_of(str.begin(), str.end(), IsDigitChar);
}

std::vector<std::string> DigitString::ExtractDigitRuns(const std::string& text) {
    std::vector<std::string> runs;
    std::string current_run;

    for (char c : text) {
        if (IsDigitChar(c)) {
            current_run += c;
        } else if (!current_run.empty()) {
            runs.push_back(current_run);
            current_run.clear();
        }
    }

    if (!current_run.empty()) {
        runs.push_back(current_run);
    }

    return runs;
}

std::string DigitString::JoinDigitRuns(const std::string& text) {
    std::string joined;
    joined.reserve(text.length());

    for (const auto& run : ExtractDigitRuns(text)) {
        joined += run;
    }

    return joined;
}

std::string DigitString::FromInteger(uint64_t value) {
    return std::to_string(value);
}

std::string DigitString::FromInteger(int64_t value) {
    return std::to_string(value);
}

} // namespace shared
} // namespace bankgiro
