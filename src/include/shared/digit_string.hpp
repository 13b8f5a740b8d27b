#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace bankgiro {
namespace shared {

class DigitString {
public:
    // ASCII '0'-'9' only, no locale lookups
    static bool IsDigitChar(char c);

    // True for a non-empty string made only of ASCII digits
    static bool IsDigitString(const std::string& str);

    // Every maximal run of consecutive digits, left to right
    // Example: "12;30.4564" -> {"12", "30", "4564"}
    static std::vector<std::string> ExtractDigitRuns(const std::string& text);

    // All digits of text in order, non-digits dropped
    static std::string JoinDigitRuns(const std::string& text);

    // Decimal text of an integer. Negative values keep their sign
    // so that callers reject them as non-numeric.
    static std::string FromInteger(uint64_t value);
    static std::string FromInteger(int64_t value);
};

} // namespace shared
} // namespace bankgiro
