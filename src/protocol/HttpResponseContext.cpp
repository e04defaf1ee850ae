#include "codetap/protocol/HttpResponseContext.h"
#include "codetap/protocol/HttpRequest.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace codetap {
namespace protocol {

static bool HeaderContainsTokenCI(const std::string& v, const std::string& token) {
    return HttpRequest::ToLower(v).find(token) != std::string::npos;
}

static std::string TrimOws(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
    return s.substr(b, e - b);
}

void HttpResponseContext::reset() {
    state_ = kExpectStatusLine;
    headerBuf_.clear();
    error_.clear();
    httpMajor_ = 1;
    httpMinor_ = 1;
    statusCode_ = 0;
    reason_.clear();
    headers_.clear();
    keepAlive_ = false;
    expectNoBody_ = false;
    body_.reset();
    bodyData_.clear();
}

void HttpResponseContext::fail(const std::string& why) {
    state_ = kError;
    error_ = why;
    keepAlive_ = false;
}

std::map<std::string, std::string> HttpResponseContext::headerMap() const {
    std::map<std::string, std::string> out;
    for (const auto& kv : headers_) {
        auto it = out.find(kv.first);
        if (it == out.end()) {
            out.emplace(kv.first, kv.second);
        } else {
            it->second.append(", ").append(kv.second);
        }
    }
    return out;
}

std::string HttpResponseContext::getHeader(const std::string& field) const {
    const std::string key = HttpRequest::ToLower(field);
    std::string result;
    for (const auto& kv : headers_) {
        if (kv.first != key) continue;
        if (!result.empty()) result.append(", ");
        result.append(kv.second);
    }
    return result;
}

bool HttpResponseContext::parseHeaderBlock(const std::string& headerBlock) {
    headers_.clear();

    size_t pos = 0;
    size_t lineEnd = headerBlock.find("\r\n", pos);
    if (lineEnd == std::string::npos) {
        fail("missing status line");
        return false;
    }
    const std::string statusLine = headerBlock.substr(0, lineEnd);
    pos = lineEnd + 2;

    // HTTP/1.1 200 OK
    if (statusLine.rfind("HTTP/", 0) != 0) {
        fail("bad status line: " + statusLine.substr(0, 64));
        return false;
    }
    const size_t sp1 = statusLine.find(' ');
    if (sp1 == std::string::npos || sp1 + 4 > statusLine.size()) {
        fail("bad status line: " + statusLine.substr(0, 64));
        return false;
    }
    const std::string ver = statusLine.substr(5, sp1 - 5);
    const size_t dot = ver.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= ver.size()) {
        fail("bad HTTP version: " + ver);
        return false;
    }
    httpMajor_ = std::atoi(ver.substr(0, dot).c_str());
    httpMinor_ = std::atoi(ver.substr(dot + 1).c_str());

    const std::string code = statusLine.substr(sp1 + 1, 3);
    if (!std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        fail("bad status code: " + code);
        return false;
    }
    statusCode_ = std::atoi(code.c_str());
    if (statusCode_ < 100) {
        fail("bad status code: " + code);
        return false;
    }
    reason_ = sp1 + 4 < statusLine.size() ? TrimOws(statusLine.substr(sp1 + 4)) : std::string();

    // Headers
    while (pos < headerBlock.size()) {
        const size_t next = headerBlock.find("\r\n", pos);
        if (next == std::string::npos) break;
        if (next == pos) {
            pos += 2;
            break;
        }
        const std::string line = headerBlock.substr(pos, next - pos);
        pos = next + 2;
        const size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) continue;
        headers_.emplace_back(HttpRequest::ToLower(line.substr(0, colon)), TrimOws(line.substr(colon + 1)));
    }

    if (statusCode_ >= 100 && statusCode_ < 200 && statusCode_ != 101) {
        // interim response, the real one follows
        headers_.clear();
        state_ = kExpectStatusLine;
        return true;
    }

    const std::string te = getHeader("transfer-encoding");
    const std::string cl = getHeader("content-length");
    const std::string conn = getHeader("connection");

    if (httpMajor_ == 1 && httpMinor_ == 0) {
        keepAlive_ = HeaderContainsTokenCI(conn, "keep-alive");
    } else {
        keepAlive_ = !HeaderContainsTokenCI(conn, "close");
    }

    if (expectNoBody_ || statusCode_ == 204 || statusCode_ == 304 || statusCode_ == 101) {
        state_ = kGotAll;
        return true;
    }

    if (!te.empty() && HeaderContainsTokenCI(te, "chunked")) {
        body_.startChunked();
        state_ = kExpectBody;
        return true;
    }

    if (!cl.empty()) {
        if (!std::all_of(cl.begin(), cl.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            fail("bad Content-Length: " + cl);
            return false;
        }
        errno = 0;
        const unsigned long long n = std::strtoull(cl.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            fail("bad Content-Length: " + cl);
            return false;
        }
        if (body_.startLength(static_cast<size_t>(n)) == HttpBodyReader::kTooLarge) {
            fail("response body too large");
            return false;
        }
        state_ = body_.done() ? kGotAll : kExpectBody;
        return true;
    }

    body_.startUntilClose();
    keepAlive_ = false;
    state_ = kExpectBody;
    return true;
}

bool HttpResponseContext::consumeBody(const char* data, size_t len, size_t* consumed) {
    switch (body_.Consume(data, len, consumed, &bodyData_)) {
        case HttpBodyReader::kDone:
            state_ = kGotAll;
            return true;
        case HttpBodyReader::kNeedMore:
            return true;
        case HttpBodyReader::kTooLarge:
            fail("response body too large");
            return false;
        case HttpBodyReader::kError:
        default:
            fail("malformed chunked body");
            return false;
    }
}

bool HttpResponseContext::feed(const char* data, size_t len, size_t* consumed) {
    size_t off = 0;
    while (state_ != kError && state_ != kGotAll && off < len) {
        if (state_ == kExpectStatusLine || state_ == kExpectHeaders) {
            const size_t old = headerBuf_.size();
            headerBuf_.append(data + off, len - off);
            const size_t hdrPos = headerBuf_.find("\r\n\r\n", old >= 3 ? old - 3 : 0);
            if (hdrPos == std::string::npos) {
                off = len;
                state_ = kExpectHeaders;
                if (headerBuf_.size() > kMaxHeaderBytes) {
                    fail("response header block too large");
                }
                break;
            }
            const size_t headerEnd = hdrPos + 4;
            off += headerEnd - old;
            const std::string headerBlock = headerBuf_.substr(0, headerEnd);
            headerBuf_.clear();
            if (!parseHeaderBlock(headerBlock)) break;
            continue;
        }

        // kExpectBody
        size_t used = 0;
        if (!consumeBody(data + off, len - off, &used)) break;
        off += used;
        if (state_ == kExpectBody) break;
    }
    if (consumed != nullptr) *consumed = off;
    return state_ == kGotAll;
}

bool HttpResponseContext::onClose() {
    if (state_ == kGotAll) return true;
    if (state_ == kExpectBody && body_.FinishOnClose() == HttpBodyReader::kDone) {
        state_ = kGotAll;
        return true;
    }
    if (state_ != kError) {
        fail("connection closed before the response completed");
    }
    return false;
}

} // namespace protocol
} // namespace codetap
