#include "codetap/audit/EntryBuilder.h"
#include "codetap/protocol/HttpRequest.h"
#include "codetap/common/Logger.h"

#include <openssl/evp.h>

namespace codetap {
namespace audit {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string Sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        LOG_ERROR << "EntryBuilder: SHA-256 digest failed";
        return std::string();
    }
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0F]);
    }
    return out;
}

} // namespace

std::string EntryBuilder::PercentDecode(const std::string& s, bool plusAsSpace) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            const int hi = HexValue(s[i + 1]);
            const int lo = HexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(plusAsSpace && c == '+' ? ' ' : c);
    }
    return out;
}

StringMap EntryBuilder::ParseQuery(const std::string& rawQuery) {
    StringMap out;
    size_t start = 0;
    while (start < rawQuery.size()) {
        size_t amp = rawQuery.find('&', start);
        if (amp == std::string::npos) amp = rawQuery.size();
        const std::string pair = rawQuery.substr(start, amp - start);
        start = amp + 1;
        if (pair.empty()) continue;
        const size_t eq = pair.find('=');
        const std::string name = PercentDecode(pair.substr(0, eq), true);
        const std::string value = eq == std::string::npos ? std::string() : PercentDecode(pair.substr(eq + 1), true);
        out[CleanUtf8(name)] = CleanUtf8(value);
    }
    return out;
}

std::string EntryBuilder::CleanUtf8(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    const size_t n = raw.size();
    size_t i = 0;
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(raw[i]);
        if (c == 0) {
            ++i;
            continue;
        }
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }
        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;        // overlong
            else if (c == 0xED) hi = 0x9F;   // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;        // overlong
            else if (c == 0xF4) hi = 0x8F;   // above U+10FFFF
        } else {
            ++i;
            continue;
        }
        bool valid = i + len <= n;
        for (size_t k = 1; valid && k < len; ++k) {
            const unsigned char cc = static_cast<unsigned char>(raw[i + k]);
            const unsigned char min = k == 1 ? lo : 0x80;
            const unsigned char max = k == 1 ? hi : 0xBF;
            if (cc < min || cc > max) valid = false;
        }
        if (!valid) {
            ++i;
            continue;
        }
        out.append(raw, i, len);
        i += len;
    }
    return out;
}

std::string EntryBuilder::RowHash(const std::string& method,
                                  const std::string& path,
                                  const StringMap& query,
                                  const std::string& requestBody,
                                  int responseStatus) {
    nlohmann::json key;
    key["method"] = method;
    key["path"] = path;
    key["query"] = query;
    key["request_body"] = requestBody;
    key["response_status"] = responseStatus;
    return Sha256Hex(DumpJson(key));
}

EntryPtr EntryBuilder::Build(const codetap::protocol::HttpRequest& req,
                             const Forwarder::Outcome& outcome,
                             const RequestMetadata& metadata,
                             const std::string& sanitizedBody) {
    auto entry = std::make_shared<Entry>();
    entry->timestamp = FormatUtcMillis(NowEpochMillis()).value_or(std::string());
    entry->method = req.methodString();
    entry->path = CleanUtf8(PercentDecode(req.path(), false));
    entry->query = ParseQuery(req.query());
    entry->requestHeaders = req.headers();
    entry->requestBody = CleanUtf8(req.body());
    entry->responseStatus = outcome.status;
    for (const auto& h : outcome.headers) {
        auto it = entry->responseHeaders.find(h.first);
        if (it == entry->responseHeaders.end()) {
            entry->responseHeaders.emplace(h.first, h.second);
        } else {
            it->second.append(", ").append(h.second);
        }
    }
    entry->responseBody = sanitizedBody;
    entry->durationMs = outcome.durationMs;
    entry->metadata = metadata;
    entry->rowHash = RowHash(entry->method, entry->path, entry->query,
                             entry->requestBody, entry->responseStatus);
    return entry;
}

} // namespace audit
} // namespace codetap
