#pragma once

#include "codetap/common/noncopyable.h"
#include "codetap/network/InetAddress.h"
#include "codetap/protocol/UpstreamUrl.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace codetap {
namespace network {
class EventLoop;
class EventLoopThread;
class TlsContext;
}

namespace protocol {

class UpstreamConnectionPool;

// Asynchronous HTTP/1.1 client bound to one upstream. Every exchange is
// bounded by a timer; the outcome is reported through a status enum, never
// an exception. Content-encoded bodies (gzip, deflate) are decoded.
class HttpClient : codetap::common::noncopyable {
public:
    enum Outcome {
        kOk,
        kTimeout,
        kConnectFailed,   // DNS, TCP connect or TLS handshake
        kProtocolError,   // early close, malformed response, bad encoding
    };

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    struct Request {
        std::string method;
        std::string target;   // origin-form path plus optional "?query"
        HeaderList headers;   // sent as given; framing headers are added here
        std::string body;
    };

    struct Result {
        Outcome outcome{kProtocolError};
        int status{0};
        std::string reason;
        HeaderList headers;   // lower-cased names, as received
        std::string body;     // decoded
        std::string error;
        double durationMs{0.0};
    };

    using ResultCallback = std::function<void(const Result&)>;

    static const int kDefaultTimeoutMs = 30000;
    // A resolved upstream address is reused this long.
    static const int kResolveTtlMs = 60000;

    HttpClient(const UpstreamUrl& upstream,
               codetap::network::TlsContext* tls,
               UpstreamConnectionPool* pool,
               int timeoutMs = kDefaultTimeoutMs);
    ~HttpClient();

    const UpstreamUrl& upstream() const { return upstream_; }
    int timeoutMs() const { return timeoutMs_; }

    // Starts an exchange on loop; cb runs later on the same loop. Call from
    // loop's thread.
    void Send(codetap::network::EventLoop* loop, Request request, ResultCallback cb);

    static const char* OutcomeName(Outcome o);

private:
    class Exchange;
    friend class Exchange;

    using ResolveCallback = std::function<void(std::optional<codetap::network::InetAddress>)>;

    // A fresh cached address is handed over at once; otherwise getaddrinfo
    // runs on the resolver thread and cb is queued back onto loop.
    void ResolveUpstream(codetap::network::EventLoop* loop, ResolveCallback cb);
    std::optional<codetap::network::InetAddress> CachedAddress();
    void ForgetResolved();

    const UpstreamUrl upstream_;
    codetap::network::TlsContext* tls_;
    UpstreamConnectionPool* pool_;
    const int timeoutMs_;

    std::mutex mu_;
    std::optional<codetap::network::InetAddress> resolved_;
    std::chrono::steady_clock::time_point resolvedAt_;

    // last member: joined before the cache goes away
    std::unique_ptr<codetap::network::EventLoopThread> resolverThread_;
    codetap::network::EventLoop* resolverLoop_{nullptr};
};

} // namespace protocol
} // namespace codetap
