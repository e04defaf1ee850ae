#include "codetap/network/Buffer.h"
#include "codetap/protocol/HttpContext.h"
#include "codetap/common/Logger.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace codetap {
namespace protocol {

namespace {

bool HeaderHasToken(const std::string& value, const std::string& token) {
    return HttpRequest::ToLower(value).find(token) != std::string::npos;
}

bool ParseContentLength(const std::string& s, size_t* out) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    errno = 0;
    const unsigned long long v = std::strtoull(s.c_str(), nullptr, 10);
    if (errno == ERANGE) return false;
    *out = static_cast<size_t>(v);
    return true;
}

} // namespace

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end && space != start) {
            // absolute-form targets are reduced to their path
            const char* target = start;
            static const char kHttp[] = "http://";
            static const char kHttps[] = "https://";
            if (std::search(start, space, kHttp, kHttp + 7) == start ||
                std::search(start, space, kHttps, kHttps + 8) == start) {
                const char* authority = std::find(start, space, ':') + 3;
                target = std::find(authority, space, '/');
            }
            const char* question = std::find(target, space, '?');
            if (question != space) {
                request_.setPath(target, question);
                request_.setQuery(question + 1, space);
            } else {
                request_.setPath(target, space);
            }
            if (request_.path().empty()) request_.setPath("/");
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

bool HttpContext::startBody() {
    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty() && HeaderHasToken(te, "chunked")) {
        body_.startChunked();
        state_ = kExpectBody;
        return true;
    }
    const std::string cl = request_.getHeader("Content-Length");
    if (cl.empty()) {
        state_ = kGotAll;
        return true;
    }
    size_t length = 0;
    if (!ParseContentLength(cl, &length)) {
        LOG_DEBUG << "HttpContext: bad Content-Length '" << cl << "'";
        return false;
    }
    if (body_.startLength(length) == HttpBodyReader::kTooLarge) {
        request_.setBodyTooLarge(true);
        state_ = kGotAll;
        return true;
    }
    state_ = body_.done() ? kGotAll : kExpectBody;
    return true;
}

// return false if any error
bool HttpContext::parseRequest(codetap::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    bool ok = true;
    bool hasMore = true;
    while (hasMore && ok) {
        if (state_ == kExpectRequestLine || state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (crlf == nullptr) {
                if (headerBytes_ + buf->ReadableBytes() > kMaxHeaderBytes) {
                    LOG_DEBUG << "HttpContext: header block too large";
                    ok = false;
                }
                hasMore = false;
                continue;
            }
            headerBytes_ += static_cast<size_t>(crlf + 2 - buf->Peek());
            if (headerBytes_ > kMaxHeaderBytes) {
                ok = false;
                continue;
            }
            if (state_ == kExpectRequestLine) {
                ok = processRequestLine(buf->Peek(), crlf);
                if (ok) state_ = kExpectHeaders;
                buf->RetrieveUntil(crlf + 2);
                continue;
            }
            if (crlf == buf->Peek()) {
                // empty line, end of headers
                buf->Retrieve(2);
                ok = startBody();
                continue;
            }
            const char* colon = std::find(buf->Peek(), crlf, ':');
            if (colon == crlf || colon == buf->Peek()) {
                ok = false;
                continue;
            }
            request_.addHeader(buf->Peek(), colon, crlf);
            buf->RetrieveUntil(crlf + 2);
        } else if (state_ == kExpectBody) {
            size_t consumed = 0;
            const HttpBodyReader::Result r =
                body_.Consume(buf->Peek(), buf->ReadableBytes(), &consumed, request_.mutableBody());
            buf->Retrieve(consumed);
            switch (r) {
                case HttpBodyReader::kDone:
                    state_ = kGotAll;
                    break;
                case HttpBodyReader::kTooLarge:
                    request_.setBodyTooLarge(true);
                    state_ = kGotAll;
                    break;
                case HttpBodyReader::kError:
                    LOG_DEBUG << "HttpContext: malformed chunked body";
                    ok = false;
                    break;
                case HttpBodyReader::kNeedMore:
                    hasMore = false;
                    break;
            }
        } else {
            hasMore = false;
        }
    }
    return ok;
}

} // namespace protocol
} // namespace codetap
