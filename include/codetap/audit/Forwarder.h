#pragma once

#include "codetap/protocol/HttpClient.h"
#include "codetap/protocol/HttpRequest.h"

#include <cstddef>
#include <functional>
#include <string>

namespace codetap {
namespace network {
class EventLoop;
}

namespace audit {

// Relays an admitted request to the upstream and maps transport failures to
// the status the caller sees.
class Forwarder {
public:
    static const size_t kMaxBodyBytes = 2 * 1024 * 1024;

    struct Outcome {
        codetap::protocol::HttpClient::Outcome transport{codetap::protocol::HttpClient::kOk};
        int status{0};
        codetap::protocol::HttpClient::HeaderList headers;
        std::string body;
        double durationMs{0.0};
        std::string error;

        bool upstreamAnswered() const { return transport == codetap::protocol::HttpClient::kOk; }
    };

    using Callback = std::function<void(const Outcome&)>;

    explicit Forwarder(codetap::protocol::HttpClient* client) : client_(client) {}

    static bool TooLarge(const codetap::protocol::HttpRequest& req) {
        return req.bodyTooLarge() || req.body().size() > kMaxBodyBytes;
    }

    // Upstream request for req: target joined onto the base path, raw query
    // kept, Host rewritten, framing headers dropped, gzip/deflate accepted.
    codetap::protocol::HttpClient::Request BuildRequest(const codetap::protocol::HttpRequest& req) const;

    // Runs cb on loop once the upstream answered or failed.
    void Forward(codetap::network::EventLoop* loop,
                 const codetap::protocol::HttpRequest& req,
                 Callback cb);

    // 504 for timeouts, 502 for every other transport failure.
    static int StatusFor(codetap::protocol::HttpClient::Outcome transport);
    static const char* BodyFor(codetap::protocol::HttpClient::Outcome transport);

    // Inbound request headers that must not reach the upstream.
    static bool IsDroppedRequestHeader(const std::string& lowerName);

private:
    codetap::protocol::HttpClient* client_;
};

} // namespace audit
} // namespace codetap
