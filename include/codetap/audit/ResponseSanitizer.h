#pragma once

#include <string>

namespace codetap {
namespace audit {

// Keeps tab, LF, CR and printable ASCII; everything else is dropped.
// Empty input becomes "{}".
class ResponseSanitizer {
public:
    static const char kEmptyBody[];

    static std::string Sanitize(const std::string& text);

    static bool IsSafeByte(unsigned char c) {
        return c == '\t' || c == '\n' || c == '\r' || (c >= 0x20 && c <= 0x7E);
    }
};

} // namespace audit
} // namespace codetap
