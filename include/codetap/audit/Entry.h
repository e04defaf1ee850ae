#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace codetap {
namespace audit {

using StringMap = std::map<std::string, std::string>;

// Context derived from one request; every field is independently optional.
struct RequestMetadata {
    std::optional<std::string> authHeader;
    std::optional<std::string> clientIp;
    std::optional<std::string> userAgent;
    std::optional<std::string> windowsUsername;
    std::optional<std::string> fileExtension;
    std::optional<std::string> operationType;
    std::optional<std::string> gitBranch;
    std::optional<std::string> project;
    std::optional<std::string> editor;
    std::optional<std::string> platform;
    std::optional<std::string> eventTime;   // ISO-8601 UTC
    std::optional<std::string> absoluteFilepath;
    std::optional<std::string> eventType;
    std::optional<std::string> language;
};

// Audit record of one exchange. Built once by EntryBuilder, then shared
// read-only with the sinks and the console.
struct Entry {
    std::string timestamp;
    std::string method;
    std::string path;
    StringMap query;
    StringMap requestHeaders;
    std::string requestBody;
    int responseStatus{0};
    StringMap responseHeaders;
    std::string responseBody;
    double durationMs{0.0};
    std::string rowHash;
    RequestMetadata metadata;
};

using EntryPtr = std::shared_ptr<const Entry>;

// snake_case object; absent metadata serializes as null.
nlohmann::json ToJson(const Entry& entry);

// Compact JSON text. Invalid UTF-8 in any string is dropped, not thrown.
std::string DumpJson(const nlohmann::json& j);

// Milliseconds since the epoch as "YYYY-MM-DDTHH:MM:SS.mmmZ". nullopt when
// the instant falls outside years 1970..9999.
std::optional<std::string> FormatUtcMillis(std::int64_t epochMs);

std::int64_t NowEpochMillis();

} // namespace audit
} // namespace codetap
