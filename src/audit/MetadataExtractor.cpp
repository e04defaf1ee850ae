#include "codetap/audit/MetadataExtractor.h"
#include "codetap/common/Logger.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace codetap {
namespace audit {

namespace {

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

const std::string* FindHeader(const StringMap& headers, const char* name) {
    auto it = headers.find(name);
    return it == headers.end() ? nullptr : &it->second;
}

std::optional<std::string> ValidIp(const std::string& candidate) {
    const std::string v = Trim(candidate);
    if (MetadataExtractor::IsIpv4Literal(v)) return v;
    return std::nullopt;
}

// Largest instant that still formats with a four digit year.
const double kMaxEventMillis = 253402300799999.0;

} // namespace

nlohmann::json MetadataExtractor::ParseBodyObject(const std::string& body) {
    if (body.empty() || body.size() >= kMaxJsonBodyBytes) {
        return nlohmann::json::object();
    }
    nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return nlohmann::json::object();
    }
    return parsed;
}

bool MetadataExtractor::IsIpv4Literal(const std::string& s) {
    int groups = 0;
    size_t i = 0;
    while (true) {
        size_t digits = 0;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
            ++digits;
            ++i;
        }
        if (digits == 0 || digits > 3) return false;
        ++groups;
        if (i == s.size()) break;
        if (s[i] != '.' || groups == 4) return false;
        ++i;
    }
    return groups == 4;
}

std::optional<std::string> MetadataExtractor::ClientIp(const StringMap& headers) {
    if (const std::string* realIp = FindHeader(headers, "x-real-ip")) {
        if (auto ip = ValidIp(*realIp)) return ip;
    }
    if (const std::string* xff = FindHeader(headers, "x-forwarded-for")) {
        size_t start = 0;
        while (start <= xff->size()) {
            size_t comma = xff->find(',', start);
            if (comma == std::string::npos) comma = xff->size();
            if (auto ip = ValidIp(xff->substr(start, comma - start))) return ip;
            start = comma + 1;
        }
    }
    if (const std::string* forwarded = FindHeader(headers, "x-forwarded")) {
        if (auto ip = ValidIp(*forwarded)) return ip;
    }
    if (const std::string* host = FindHeader(headers, "host")) {
        if (auto ip = ValidIp(*host)) return ip;
    }
    return std::nullopt;
}

std::optional<std::string> MetadataExtractor::UserAgent(const StringMap& headers) {
    if (const std::string* ua = FindHeader(headers, "user-agent")) return *ua;
    return std::nullopt;
}

std::optional<std::string> MetadataExtractor::WindowsUsername(const std::string& path) {
    // <drive letter>:\Users\<name>, first occurrence with a non-empty name
    static const std::string kUsersDir = ":\\Users\\";
    size_t pos = path.find(kUsersDir);
    while (pos != std::string::npos) {
        if (pos > 0 && std::isalpha(static_cast<unsigned char>(path[pos - 1]))) {
            const size_t start = pos + kUsersDir.size();
            const size_t end = path.find_first_of("\\/", start);
            const size_t len = (end == std::string::npos ? path.size() : end) - start;
            if (len > 0) return TruncateChars(path.substr(start, len), kLongFieldCap);
        }
        pos = path.find(kUsersDir, pos + 1);
    }
    return std::nullopt;
}

std::optional<std::string> MetadataExtractor::FileExtension(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    const size_t firstNonDot = name.find_first_not_of('.');
    if (firstNonDot == std::string::npos) return std::nullopt;
    name.erase(0, firstNonDot);
    const size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 == name.size()) return std::nullopt;
    std::string ext = name.substr(dot);
    for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext;
}

std::string MetadataExtractor::TruncateChars(const std::string& s, size_t cap) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        // count lead bytes only
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (chars == cap) return s.substr(0, i);
            ++chars;
        }
    }
    return s;
}

std::optional<std::string> MetadataExtractor::PickField(const nlohmann::json& obj,
                                                        const char* camelKey,
                                                        const char* snakeKey,
                                                        size_t cap) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(camelKey);
    if (it == obj.end() && snakeKey != nullptr && snakeKey[0] != '\0') {
        it = obj.find(snakeKey);
    }
    if (it == obj.end()) return std::nullopt;

    std::string text;
    if (it->is_string()) {
        text = it->get<std::string>();
    } else if (it->is_number() || it->is_boolean()) {
        text = it->dump();
    } else {
        return std::nullopt;
    }
    return TruncateChars(text, cap);
}

std::optional<std::string> MetadataExtractor::EventTime(const nlohmann::json& value) {
    double ms = 0.0;
    if (value.is_number_unsigned()) {
        ms = static_cast<double>(value.get<std::uint64_t>());
    } else if (value.is_number_integer()) {
        ms = static_cast<double>(value.get<std::int64_t>());
    } else if (value.is_number_float()) {
        ms = value.get<double>();
    } else if (value.is_string()) {
        const std::string text = Trim(value.get<std::string>());
        if (text.empty()) return std::nullopt;
        // decimal only; strtod would also take hex, inf and nan
        if (text.find_first_not_of("0123456789.+-eE") != std::string::npos) return std::nullopt;
        errno = 0;
        char* endp = nullptr;
        ms = std::strtod(text.c_str(), &endp);
        if (errno == ERANGE || endp != text.c_str() + text.size()) return std::nullopt;
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(ms) || ms < 0.0 || ms > kMaxEventMillis) {
        return std::nullopt;
    }
    return FormatUtcMillis(static_cast<std::int64_t>(std::floor(ms)));
}

RequestMetadata MetadataExtractor::Extract(const std::string& body, const StringMap& headers) {
    RequestMetadata meta;
    const nlohmann::json obj = ParseBodyObject(body);

    if (const std::string* auth = FindHeader(headers, "authorization")) meta.authHeader = *auth;
    meta.clientIp = ClientIp(headers);
    meta.userAgent = UserAgent(headers);

    meta.operationType = PickField(obj, "operationType", "operation_type", kShortFieldCap);
    meta.gitBranch = PickField(obj, "gitBranch", "git_branch", kLongFieldCap);
    meta.project = PickField(obj, "project", nullptr, kLongFieldCap);
    meta.editor = PickField(obj, "editor", nullptr, kShortFieldCap);
    meta.platform = PickField(obj, "platform", nullptr, kShortFieldCap);
    meta.eventType = PickField(obj, "eventType", "event_type", kShortFieldCap);
    meta.language = PickField(obj, "language", nullptr, kShortFieldCap);

    auto file = obj.find("absoluteFile");
    if (file == obj.end()) file = obj.find("absolute_file");
    if (file != obj.end() && file->is_string()) {
        const std::string path = file->get<std::string>();
        if (!path.empty()) {
            meta.absoluteFilepath = TruncateChars(path, kLongFieldCap);
            meta.windowsUsername = WindowsUsername(path);
            meta.fileExtension = FileExtension(path);
        }
    }

    auto when = obj.find("eventTime");
    if (when == obj.end()) when = obj.find("event_time");
    if (when != obj.end()) {
        meta.eventTime = EventTime(*when);
        if (!meta.eventTime) {
            LOG_DEBUG << "MetadataExtractor: ignoring unusable event time " << when->dump();
        }
    }
    return meta;
}

} // namespace audit
} // namespace codetap
