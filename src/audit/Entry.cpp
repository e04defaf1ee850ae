#include "codetap/audit/Entry.h"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace codetap {
namespace audit {

namespace {

// 9999-12-31T23:59:59.999Z
const std::int64_t kMaxEpochMillis = 253402300799999LL;

nlohmann::json OptionalJson(const std::optional<std::string>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json ToJson(const Entry& entry) {
    const RequestMetadata& m = entry.metadata;
    nlohmann::json j;
    j["timestamp"] = entry.timestamp;
    j["method"] = entry.method;
    j["path"] = entry.path;
    j["query"] = entry.query;
    j["request_headers"] = entry.requestHeaders;
    j["request_body"] = entry.requestBody;
    j["response_status"] = entry.responseStatus;
    j["response_headers"] = entry.responseHeaders;
    j["response_body"] = entry.responseBody;
    j["duration_ms"] = entry.durationMs;
    j["row_hash"] = entry.rowHash;
    j["auth_header"] = OptionalJson(m.authHeader);
    j["client_ip"] = OptionalJson(m.clientIp);
    j["user_agent"] = OptionalJson(m.userAgent);
    j["windows_username"] = OptionalJson(m.windowsUsername);
    j["file_extension"] = OptionalJson(m.fileExtension);
    j["operation_type"] = OptionalJson(m.operationType);
    j["git_branch"] = OptionalJson(m.gitBranch);
    j["project"] = OptionalJson(m.project);
    j["editor"] = OptionalJson(m.editor);
    j["platform"] = OptionalJson(m.platform);
    j["event_time"] = OptionalJson(m.eventTime);
    j["absolute_filepath"] = OptionalJson(m.absoluteFilepath);
    j["event_type"] = OptionalJson(m.eventType);
    j["language"] = OptionalJson(m.language);
    return j;
}

std::string DumpJson(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::ignore);
}

std::optional<std::string> FormatUtcMillis(std::int64_t epochMs) {
    if (epochMs < 0 || epochMs > kMaxEpochMillis) {
        return std::nullopt;
    }
    const std::time_t secs = static_cast<std::time_t>(epochMs / 1000);
    const int millis = static_cast<int>(epochMs % 1000);
    struct tm tmv;
    if (::gmtime_r(&secs, &tmv) == nullptr) {
        return std::nullopt;
    }
    char buf[40];
    std::snprintf(buf, sizeof buf, "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tmv.tm_year + 1900, tmv.tm_mon + 1, tmv.tm_mday,
                  tmv.tm_hour, tmv.tm_min, tmv.tm_sec, millis);
    return std::string(buf);
}

std::int64_t NowEpochMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace audit
} // namespace codetap
