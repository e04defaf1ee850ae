#include "codetap/protocol/HttpClient.h"
#include "codetap/protocol/Compression.h"
#include "codetap/protocol/HttpResponseContext.h"
#include "codetap/protocol/UpstreamConnectionPool.h"
#include "codetap/network/Buffer.h"
#include "codetap/network/EventLoop.h"
#include "codetap/network/EventLoopThread.h"
#include "codetap/network/TcpConnection.h"
#include "codetap/network/Timer.h"
#include "codetap/network/TlsContext.h"
#include "codetap/common/Logger.h"

#include <chrono>
#include <cstring>

namespace codetap {
namespace protocol {

using codetap::network::Buffer;
using codetap::network::EventLoop;
using codetap::network::TcpConnectionPtr;

namespace {

const size_t kMaxUpstreamBodyBytes = 64 * 1024 * 1024;

std::string BuildWire(const HttpClient::Request& req) {
    std::string wire;
    wire.reserve(256 + req.body.size());
    wire.append(req.method).append(" ").append(req.target.empty() ? "/" : req.target).append(" HTTP/1.1\r\n");
    for (const auto& h : req.headers) {
        wire.append(h.first).append(": ").append(h.second).append("\r\n");
    }
    const bool bodyAllowed = !(req.method == "GET" || req.method == "HEAD" ||
                               req.method == "DELETE" || req.method == "OPTIONS");
    if (!req.body.empty() || bodyAllowed) {
        wire.append("Content-Length: ").append(std::to_string(req.body.size())).append("\r\n");
    }
    wire.append("Connection: keep-alive\r\n\r\n");
    wire.append(req.body);
    return wire;
}

} // namespace

// One request/response exchange. Keeps itself alive until finished.
class HttpClient::Exchange : public std::enable_shared_from_this<HttpClient::Exchange> {
public:
    Exchange(HttpClient* owner, EventLoop* loop, Request req, ResultCallback cb)
        : owner_(owner),
          loop_(loop),
          method_(req.method),
          wire_(BuildWire(req)),
          cb_(std::move(cb)),
          start_(std::chrono::steady_clock::now()) {
        parser_.setMaxBodyBytes(kMaxUpstreamBodyBytes);
    }

    void Start() {
        self_ = shared_from_this();

        timer_ = std::make_shared<codetap::network::Timer>(loop_);
        std::weak_ptr<Exchange> weak = self_;
        if (!timer_->Start(owner_->timeoutMs_, 0, [weak]() {
                if (auto self = weak.lock()) self->OnTimeout();
            })) {
            Finish(kProtocolError, "cannot arm upstream timer");
            return;
        }

        auto self = self_;
        owner_->ResolveUpstream(loop_, [self](std::optional<codetap::network::InetAddress> addr) {
            self->OnResolved(std::move(addr));
        });
    }

private:
    void OnResolved(std::optional<codetap::network::InetAddress> addr) {
        if (done_) return;
        if (!addr) {
            Finish(kConnectFailed, "cannot resolve " + owner_->upstream_.host);
            return;
        }
        addr_ = std::move(addr);
        Acquire(false);
    }

    void Acquire(bool forceNew) {
        auto self = self_;
        ssl_ctx_st* tlsCtx = (owner_->upstream_.tls() && owner_->tls_) ? owner_->tls_->ctx() : nullptr;
        owner_->pool_->Acquire(loop_, *addr_, tlsCtx, owner_->upstream_.host, forceNew,
                               [self](std::shared_ptr<UpstreamConnectionPool::Lease> lease, int err) {
                                   self->OnLease(std::move(lease), err);
                               });
    }

    void OnLease(std::shared_ptr<UpstreamConnectionPool::Lease> lease, int err) {
        if (done_) {
            // timed out while connecting; the fresh connection is still good
            if (lease) lease->Release(true);
            return;
        }
        if (!lease) {
            owner_->ForgetResolved();
            Finish(kConnectFailed, std::string("connect to upstream failed: ") + std::strerror(err));
            return;
        }
        TcpConnectionPtr conn = lease->connection();
        if (!conn) {
            lease->Release(false);
            Finish(kConnectFailed, "upstream connection vanished");
            return;
        }
        lease_ = std::move(lease);
        received_ = 0;
        parser_.reset();
        parser_.setExpectNoBody(method_ == "HEAD");

        std::weak_ptr<Exchange> weak = self_;
        lease_->client()->RebindCallbacks(
            [weak](const TcpConnectionPtr& c) {
                if (c->connected()) return;
                if (auto self = weak.lock()) self->OnClosed();
            },
            [weak](const TcpConnectionPtr&, Buffer* buf, std::chrono::system_clock::time_point) {
                if (auto self = weak.lock()) {
                    self->OnData(buf);
                } else {
                    buf->RetrieveAll();
                }
            });
        conn->Send(wire_);
    }

    // Only these may be sent twice when a pooled connection dies silently.
    bool Idempotent() const {
        return method_ == "GET" || method_ == "HEAD" || method_ == "OPTIONS";
    }

    void OnData(Buffer* buf) {
        if (done_) {
            buf->RetrieveAll();
            return;
        }
        const size_t n = buf->ReadableBytes();
        received_ += n;
        size_t consumed = 0;
        parser_.feed(buf->Peek(), n, &consumed);
        buf->RetrieveAll();
        if (consumed < n) leftover_ = true;
        if (parser_.hasError()) {
            Finish(kProtocolError, parser_.error());
        } else if (parser_.gotAll()) {
            Complete();
        }
    }

    void OnClosed() {
        if (done_) return;
        if (received_ == 0 && lease_ && lease_->reused() && !retried_ && Idempotent()) {
            // the idle connection was closed by the upstream before we used it
            LOG_DEBUG << "HttpClient: pooled connection went stale, reconnecting";
            retried_ = true;
            lease_->Release(false);
            lease_.reset();
            Acquire(true);
            return;
        }
        if (parser_.onClose()) {
            Complete();
        } else {
            Finish(kProtocolError, parser_.error().empty() ? "upstream closed the connection" : parser_.error());
        }
    }

    void OnTimeout() {
        if (done_) return;
        Finish(kTimeout, "upstream timed out after " + std::to_string(owner_->timeoutMs_) + " ms");
    }

    void Complete() {
        Result result;
        result.status = parser_.statusCode();
        result.reason = parser_.reason();
        result.headers = parser_.headers();

        const std::string encoding = parser_.getHeader("content-encoding");
        const Compression::Encoding enc = Compression::ParseContentEncoding(encoding);
        std::string* raw = parser_.mutableBody();
        if (raw->empty() || enc == Compression::Encoding::kIdentity) {
            result.body.swap(*raw);
        } else if (enc == Compression::Encoding::kUnknown) {
            Finish(kProtocolError, "unsupported content-encoding: " + encoding);
            return;
        } else if (!Compression::Decompress(enc, *raw, &result.body)) {
            Finish(kProtocolError, "cannot decode " + encoding + " response body");
            return;
        }

        const bool keepAlive = parser_.keepAlive() && !leftover_;
        if (lease_) {
            lease_->Release(keepAlive);
            lease_.reset();
        }
        result.outcome = kOk;
        Deliver(std::move(result));
    }

    void Finish(Outcome outcome, const std::string& error) {
        if (done_) return;
        if (lease_) {
            lease_->Release(false);
            lease_.reset();
        }
        Result result;
        result.outcome = outcome;
        result.error = error;
        Deliver(std::move(result));
    }

    void Deliver(Result result) {
        done_ = true;
        if (timer_) timer_->Cancel();
        result.durationMs = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
        if (result.outcome != kOk) {
            LOG_WARN << "HttpClient: " << method_ << " upstream " << OutcomeName(result.outcome)
                     << ": " << result.error;
        }
        ResultCallback cb = std::move(cb_);
        auto keep = std::move(self_);
        if (cb) cb(result);
    }

    HttpClient* owner_;
    EventLoop* loop_;
    std::string method_;
    std::string wire_;
    ResultCallback cb_;
    std::chrono::steady_clock::time_point start_;

    std::shared_ptr<Exchange> self_;
    std::shared_ptr<codetap::network::Timer> timer_;
    std::optional<codetap::network::InetAddress> addr_;
    std::shared_ptr<UpstreamConnectionPool::Lease> lease_;
    HttpResponseContext parser_;
    size_t received_{0};
    bool leftover_{false};
    bool retried_{false};
    bool done_{false};
};

HttpClient::HttpClient(const UpstreamUrl& upstream,
                       codetap::network::TlsContext* tls,
                       UpstreamConnectionPool* pool,
                       int timeoutMs)
    : upstream_(upstream),
      tls_(tls),
      pool_(pool),
      timeoutMs_(timeoutMs),
      resolverThread_(new codetap::network::EventLoopThread("resolver")) {
    resolverLoop_ = resolverThread_->StartLoop();
}

HttpClient::~HttpClient() = default;

const char* HttpClient::OutcomeName(Outcome o) {
    switch (o) {
        case kOk: return "ok";
        case kTimeout: return "timeout";
        case kConnectFailed: return "connect-failed";
        case kProtocolError: return "protocol-error";
        default: return "unknown";
    }
}

std::optional<codetap::network::InetAddress> HttpClient::CachedAddress() {
    std::lock_guard<std::mutex> lock(mu_);
    if (resolved_ &&
        std::chrono::steady_clock::now() - resolvedAt_ < std::chrono::milliseconds(kResolveTtlMs)) {
        return resolved_;
    }
    return std::nullopt;
}

void HttpClient::ResolveUpstream(EventLoop* loop, ResolveCallback cb) {
    if (auto cached = CachedAddress()) {
        cb(std::move(cached));
        return;
    }
    resolverLoop_->RunInLoop([this, loop, cb]() {
        // an earlier queued lookup may have refreshed the cache
        std::optional<codetap::network::InetAddress> addr = CachedAddress();
        if (!addr) {
            addr = codetap::network::InetAddress::Resolve(upstream_.host, upstream_.port);
            if (addr) {
                std::lock_guard<std::mutex> lock(mu_);
                resolved_ = addr;
                resolvedAt_ = std::chrono::steady_clock::now();
            }
        }
        loop->QueueInLoop([cb, addr]() { cb(addr); });
    });
}

void HttpClient::ForgetResolved() {
    std::lock_guard<std::mutex> lock(mu_);
    resolved_.reset();
}

void HttpClient::Send(EventLoop* loop, Request request, ResultCallback cb) {
    auto exchange = std::make_shared<Exchange>(this, loop, std::move(request), std::move(cb));
    exchange->Start();
}

} // namespace protocol
} // namespace codetap
