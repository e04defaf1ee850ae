#pragma once

#include "codetap/audit/Entry.h"

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>

namespace codetap {
namespace audit {

// Live, colorized summary of each exchange. Best effort: a failing stream is
// logged and otherwise ignored.
class ConsoleRenderer {
public:
    static const size_t kPreviewChars = 400;

    ConsoleRenderer(std::ostream& out, bool color) : out_(out), color_(color) {}

    void setColor(bool on) { color_ = on; }
    bool color() const { return color_; }

    // rawQuery is the query string as received (without '?'); responseText is
    // the body relayed to the client.
    void Render(const Entry& entry, const std::string& rawQuery, const std::string& responseText);

    // First kPreviewChars characters plus "...(truncated N chars)" when longer.
    static std::string Preview(const std::string& value);
    static const char* StatusColor(int status);

private:
    void Line(const char* color, const std::string& text);

    std::ostream& out_;
    bool color_;
    std::mutex mutex_;
};

} // namespace audit
} // namespace codetap
