#pragma once

#include "codetap/protocol/HttpBodyReader.h"
#include "codetap/protocol/HttpRequest.h"

#include <chrono>

namespace codetap {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental request parser, one per server connection.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    static const size_t kMaxHeaderBytes = 64 * 1024;

    // maxBodyBytes == 0 disables the body limit.
    explicit HttpContext(size_t maxBodyBytes = 0)
        : state_(kExpectRequestLine), headerBytes_(0), body_(maxBodyBytes) {}

    // return false if some error
    bool parseRequest(codetap::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    void reset() {
        state_ = kExpectRequestLine;
        HttpRequest dummy;
        request_.swap(dummy);
        headerBytes_ = 0;
        body_.reset();
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool startBody();

    HttpRequestParseState state_;
    HttpRequest request_;
    size_t headerBytes_;
    HttpBodyReader body_;
};

} // namespace protocol
} // namespace codetap
