#include "codetap/audit/ConsoleRenderer.h"
#include "codetap/common/Logger.h"

#include <cstdio>
#include <exception>
#include <ostream>

namespace codetap {
namespace audit {

namespace {

const char kCyan[] = "\033[36m";
const char kMagenta[] = "\033[35m";
const char kLightBlue[] = "\033[94m";
const char kGreen[] = "\033[32m";
const char kYellow[] = "\033[33m";
const char kRed[] = "\033[31m";
const char kLightGreen[] = "\033[92m";
const char kReset[] = "\033[0m";

bool IsContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }

} // namespace

std::string ConsoleRenderer::Preview(const std::string& value) {
    size_t chars = 0;
    size_t cut = value.size();
    for (size_t i = 0; i < value.size(); ++i) {
        if (IsContinuationByte(static_cast<unsigned char>(value[i]))) continue;
        if (chars == kPreviewChars) cut = i;
        ++chars;
    }
    if (chars <= kPreviewChars) return value;
    return value.substr(0, cut) + "...(truncated " + std::to_string(chars - kPreviewChars) + " chars)";
}

const char* ConsoleRenderer::StatusColor(int status) {
    if (status >= 500) return kRed;
    if (status >= 400) return kYellow;
    return kGreen;
}

void ConsoleRenderer::Line(const char* color, const std::string& text) {
    if (color_) out_ << color;
    out_ << text;
    if (color_) out_ << kReset;
    out_ << '\n';
}

void ConsoleRenderer::Render(const Entry& entry, const std::string& rawQuery, const std::string& responseText) {
    try {
        std::string headers;
        for (const auto& kv : entry.requestHeaders) {
            if (!headers.empty()) headers += ", ";
            headers += kv.first + ": " + kv.second;
        }
        char timing[64];
        std::snprintf(timing, sizeof timing, " (%.2fms)", entry.durationMs);

        std::lock_guard<std::mutex> lock(mutex_);
        Line(kCyan, ">> " + entry.method + " " + entry.path + (rawQuery.empty() ? "" : "?" + rawQuery));
        Line(kMagenta, "   Req headers: " + headers);
        if (!entry.requestBody.empty()) {
            Line(kLightBlue, "   Req body: " + Preview(entry.requestBody));
        }
        Line(StatusColor(entry.responseStatus), "<< " + std::to_string(entry.responseStatus) + timing);
        if (!responseText.empty()) {
            Line(kLightGreen, "   Resp body: " + Preview(responseText));
        }
        out_.flush();
        if (!out_) {
            out_.clear();
            LOG_WARN << "ConsoleRenderer: write failed for entry " << entry.rowHash;
        }
    } catch (const std::exception& e) {
        LOG_WARN << "ConsoleRenderer: render failed for entry " << entry.rowHash << ": " << e.what();
    }
}

} // namespace audit
} // namespace codetap
