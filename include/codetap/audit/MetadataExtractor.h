#pragma once

#include "codetap/audit/Entry.h"

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace codetap {
namespace audit {

// Derives RequestMetadata from a request body and its headers. Every field
// is extracted on its own; a bad field yields nullopt and nothing else.
class MetadataExtractor {
public:
    static const size_t kMaxJsonBodyBytes = 512 * 1024;
    static const size_t kShortFieldCap = 64;
    static const size_t kLongFieldCap = 2048;

    // headers: lower-cased names
    static RequestMetadata Extract(const std::string& body, const StringMap& headers);

    // Object bodies below the size cap parse to themselves; everything else
    // (arrays, scalars, null, malformed text) gives an empty object.
    static nlohmann::json ParseBodyObject(const std::string& body);

    static bool IsIpv4Literal(const std::string& s);
    static std::optional<std::string> ClientIp(const StringMap& headers);
    static std::optional<std::string> UserAgent(const StringMap& headers);
    static std::optional<std::string> WindowsUsername(const std::string& path);
    static std::optional<std::string> FileExtension(const std::string& path);

    // String, number or bool under camelKey (preferred) or snakeKey, cut to
    // cap characters. snakeKey may be empty.
    static std::optional<std::string> PickField(const nlohmann::json& obj,
                                                const char* camelKey,
                                                const char* snakeKey,
                                                size_t cap);

    // Epoch milliseconds (number or numeric string) to ISO-8601 UTC.
    static std::optional<std::string> EventTime(const nlohmann::json& value);

    // Cuts s to at most cap UTF-8 code points.
    static std::string TruncateChars(const std::string& s, size_t cap);
};

} // namespace audit
} // namespace codetap
