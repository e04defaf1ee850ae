#pragma once

#include <string>
#include <utility>
#include <vector>

namespace codetap {
namespace network {
class Buffer;
}

namespace protocol {

// Outbound response written by HttpServer. Content-Length and Connection are
// always produced here; callers never set framing headers themselves.
class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k400BadRequest = 400,
        k403Forbidden = 403,
        k404NotFound = 404,
        k413PayloadTooLarge = 413,
        k500InternalServerError = 500,
        k502BadGateway = 502,
        k503ServiceUnavailable = 503,
        k504GatewayTimeout = 504,
    };

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    explicit HttpResponse(bool close)
        : statusCode_(kUnknown), closeConnection_(close), suppressBody_(false) {}

    void setStatusCode(int code) { statusCode_ = code; }
    int statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { addHeader("Content-Type", contentType); }

    void addHeader(const std::string& key, const std::string& value) {
        headers_.emplace_back(key, value);
    }
    const HeaderList& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    // HEAD responses carry headers only.
    void setSuppressBody(bool on) { suppressBody_ = on; }

    void appendToBuffer(codetap::network::Buffer* output) const;

    static const char* ReasonPhrase(int code);

private:
    int statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    bool suppressBody_;
    HeaderList headers_;
    std::string body_;
};

} // namespace protocol
} // namespace codetap
