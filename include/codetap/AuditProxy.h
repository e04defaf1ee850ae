#pragma once

#include "codetap/AppContext.h"
#include "codetap/common/noncopyable.h"
#include "codetap/protocol/HttpServer.h"

#include <memory>
#include <string>

namespace codetap {

// The per-request pipeline on top of HttpServer:
// gate, forward, extract and sanitize, build, persist and render, respond.
class AuditProxy : common::noncopyable {
public:
    // Idle client keep-alive connections are closed after this long.
    static constexpr double kClientIdleTimeoutSec = 120.0;

    AuditProxy(network::EventLoop* loop,
               const network::InetAddress& listenAddr,
               AppContext& ctx);

    void setThreadNum(int n) { server_.setThreadNum(n); }
    void start() { server_.start(); }
    network::InetAddress listenAddress() const { return server_.listenAddress(); }

    // Upstream response headers that never reach the client.
    static bool IsStrippedResponseHeader(const std::string& lowerName);

private:
    using RequestPtr = std::shared_ptr<const protocol::HttpRequest>;

    void onRequest(const protocol::HttpRequest& req, const protocol::HttpServer::ResponderPtr& responder);
    void onForwarded(const RequestPtr& req,
                     const protocol::HttpServer::ResponderPtr& responder,
                     const audit::Forwarder::Outcome& outcome);

    AppContext& ctx_;
    protocol::HttpServer server_;
};

} // namespace codetap
