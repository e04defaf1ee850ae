#pragma once

#include <cctype>
#include <cstddef>
#include <map>
#include <string>

namespace codetap {
namespace protocol {

// Inbound HTTP/1.x request. Header names are stored lower-cased; a repeated
// header is folded into one value joined with ", ".
class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kPatch, kOptions
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    using HeaderMap = std::map<std::string, std::string>;

    HttpRequest() : method_(kInvalid), version_(kUnknown), bodyTooLarge_(false) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    bool setMethod(const char* start, const char* end) {
        method_ = ParseMethod(std::string(start, end));
        return method_ != kInvalid;
    }
    void setMethod(Method m) { method_ = m; }

    Method getMethod() const { return method_; }
    const char* methodString() const { return MethodName(method_); }

    static Method ParseMethod(const std::string& m) {
        if (m == "GET") return kGet;
        if (m == "POST") return kPost;
        if (m == "HEAD") return kHead;
        if (m == "PUT") return kPut;
        if (m == "DELETE") return kDelete;
        if (m == "PATCH") return kPatch;
        if (m == "OPTIONS") return kOptions;
        return kInvalid;
    }

    static const char* MethodName(Method m) {
        switch (m) {
            case kGet: return "GET";
            case kPost: return "POST";
            case kHead: return "HEAD";
            case kPut: return "PUT";
            case kDelete: return "DELETE";
            case kPatch: return "PATCH";
            case kOptions: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }

    // Raw (still percent-encoded) path as it appeared on the request line.
    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    void setPath(const std::string& path) { path_ = path; }
    const std::string& path() const { return path_; }

    // Raw query string, without the leading '?'.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    void setQuery(const std::string& query) { query_ = query; }
    const std::string& query() const { return query_; }

    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && isspace(static_cast<unsigned char>(value[value.size() - 1]))) {
            value.resize(value.size() - 1);
        }
        addHeader(field, value);
    }

    void addHeader(const std::string& field, const std::string& value) {
        std::string key = ToLower(field);
        auto it = headers_.find(key);
        if (it == headers_.end()) {
            headers_.emplace(std::move(key), value);
        } else {
            it->second.append(", ").append(value);
        }
    }

    // Lookup is case-insensitive; returns "" when absent.
    std::string getHeader(const std::string& field) const {
        auto it = headers_.find(ToLower(field));
        return it == headers_.end() ? std::string() : it->second;
    }

    bool hasHeader(const std::string& field) const {
        return headers_.count(ToLower(field)) != 0;
    }

    const HeaderMap& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }
    std::string* mutableBody() { return &body_; }

    // Set by the parser when the declared or accumulated body exceeds its
    // limit; the body is then incomplete and the connection unusable.
    void setBodyTooLarge(bool on) { bodyTooLarge_ = on; }
    bool bodyTooLarge() const { return bodyTooLarge_; }

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
        std::swap(bodyTooLarge_, that.bodyTooLarge_);
    }

    static std::string ToLower(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
        return out;
    }

private:
    Method method_;
    Version version_;
    std::string path_;
    std::string query_;
    HeaderMap headers_;
    std::string body_;
    bool bodyTooLarge_;
};

} // namespace protocol
} // namespace codetap
