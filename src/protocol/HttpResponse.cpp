#include "codetap/protocol/HttpResponse.h"
#include "codetap/network/Buffer.h"

#include <cstdio>
#include <cstring>

namespace codetap {
namespace protocol {

const char* HttpResponse::ReasonPhrase(int code) {
    switch (code) {
        case 100: return "Continue";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

void HttpResponse::appendToBuffer(codetap::network::Buffer* output) const {
    char buf[64];
    snprintf(buf, sizeof buf, "HTTP/1.1 %d ", statusCode_);
    output->Append(buf, strlen(buf));
    output->Append(statusMessage_.empty() ? std::string(ReasonPhrase(statusCode_)) : statusMessage_);
    output->Append("\r\n");

    snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
    output->Append(buf, strlen(buf));
    if (closeConnection_) {
        output->Append("Connection: close\r\n");
    } else {
        output->Append("Connection: keep-alive\r\n");
    }

    for (const auto& header : headers_) {
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }

    output->Append("\r\n");
    if (!suppressBody_) {
        output->Append(body_);
    }
}

} // namespace protocol
} // namespace codetap
