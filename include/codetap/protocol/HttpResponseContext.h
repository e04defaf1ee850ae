#pragma once

#include "codetap/protocol/HttpBodyReader.h"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace codetap {
namespace protocol {

// Incremental HTTP/1.x response parser used by the upstream client.
// - Supports Content-Length and Transfer-Encoding: chunked.
// - If neither is present, the body runs until close (not poolable).
// - Interim 1xx responses are skipped.
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectHeaders, kExpectBody, kGotAll, kError };

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    static const size_t kMaxHeaderBytes = 64 * 1024;

    // Feed bytes as they arrive. Returns true once the response is complete.
    // *consumed (optional) receives the number of bytes that belonged to it.
    bool feed(const char* data, size_t len, size_t* consumed = nullptr);

    // The connection closed. Returns true when that completes the response.
    bool onClose();

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    const std::string& error() const { return error_; }

    void reset();

    // Responses to HEAD carry no body regardless of their framing headers.
    void setExpectNoBody(bool on) { expectNoBody_ = on; }
    // 0 means unlimited; an oversized body is a protocol error.
    void setMaxBodyBytes(size_t n) { body_.setMaxBytes(n); }

    bool keepAlive() const { return keepAlive_; }
    bool needsCloseToFinish() const { return body_.mode() == HttpBodyReader::kUntilClose; }
    int statusCode() const { return statusCode_; }
    const std::string& reason() const { return reason_; }

    // Header names are lower-cased and kept in arrival order.
    const HeaderList& headers() const { return headers_; }
    // Same headers folded into one value per name, joined with ", ".
    std::map<std::string, std::string> headerMap() const;
    std::string getHeader(const std::string& field) const;

    const std::string& body() const { return bodyData_; }
    std::string* mutableBody() { return &bodyData_; }

private:
    bool parseHeaderBlock(const std::string& headerBlock);
    bool consumeBody(const char* data, size_t len, size_t* consumed);
    void fail(const std::string& why);

    ParseState state_{kExpectStatusLine};
    std::string headerBuf_;
    std::string error_;

    int httpMajor_{1};
    int httpMinor_{1};
    int statusCode_{0};
    std::string reason_;

    HeaderList headers_;
    bool keepAlive_{false};
    bool expectNoBody_{false};

    HttpBodyReader body_;
    std::string bodyData_;
};

} // namespace protocol
} // namespace codetap
