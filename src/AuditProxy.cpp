#include "codetap/AuditProxy.h"
#include "codetap/audit/EntryBuilder.h"
#include "codetap/audit/MetadataExtractor.h"
#include "codetap/audit/RequestGate.h"
#include "codetap/audit/ResponseSanitizer.h"
#include "codetap/common/Logger.h"
#include "codetap/network/EventLoop.h"
#include "codetap/protocol/HttpRequest.h"
#include "codetap/protocol/HttpResponse.h"

#include <exception>

namespace codetap {

using audit::Forwarder;
using protocol::HttpRequest;
using protocol::HttpResponse;
using protocol::HttpServer;

AuditProxy::AuditProxy(network::EventLoop* loop,
                       const network::InetAddress& listenAddr,
                       AppContext& ctx)
    : ctx_(ctx),
      server_(loop, listenAddr, "codetap") {
    server_.setMaxBodyBytes(Forwarder::kMaxBodyBytes);
    server_.setIdleTimeout(kClientIdleTimeoutSec);
    server_.setHttpCallback(
        std::bind(&AuditProxy::onRequest, this, std::placeholders::_1, std::placeholders::_2));
}

bool AuditProxy::IsStrippedResponseHeader(const std::string& lowerName) {
    return lowerName == "content-encoding" ||
           lowerName == "transfer-encoding" ||
           lowerName == "connection" ||
           lowerName == "keep-alive" ||
           lowerName == "content-length";
}

void AuditProxy::onRequest(const HttpRequest& req, const HttpServer::ResponderPtr& responder) {
    if (audit::RequestGate::Admit(req.headers()) == audit::RequestGate::kDeny) {
        LOG_DEBUG << "AuditProxy: rejected " << req.methodString() << " " << req.path()
                  << " user-agent='" << req.getHeader("user-agent") << "'";
        HttpResponse resp(responder->closeRequested());
        resp.setStatusCode(HttpResponse::k403Forbidden);
        resp.setContentType("text/plain");
        resp.setBody(audit::RequestGate::kDenyBody);
        responder->Send(resp);
        return;
    }

    if (Forwarder::TooLarge(req)) {
        LOG_WARN << "AuditProxy: " << req.methodString() << " " << req.path()
                 << " body exceeds " << Forwarder::kMaxBodyBytes << " bytes";
        HttpResponse resp(true);
        resp.setStatusCode(HttpResponse::k413PayloadTooLarge);
        resp.setContentType("text/plain");
        resp.setBody("Payload Too Large");
        responder->Send(resp);
        return;
    }

    auto request = std::make_shared<const HttpRequest>(req);
    network::EventLoop* loop = network::EventLoop::GetEventLoopOfCurrentThread();
    ctx_.forwarder().Forward(loop, req, [this, request, responder](const Forwarder::Outcome& outcome) {
        onForwarded(request, responder, outcome);
    });
}

void AuditProxy::onForwarded(const RequestPtr& req,
                             const HttpServer::ResponderPtr& responder,
                             const Forwarder::Outcome& outcome) {
    HttpResponse resp(responder->closeRequested());
    resp.setStatusCode(outcome.status);
    if (outcome.upstreamAnswered()) {
        for (const auto& h : outcome.headers) {
            if (IsStrippedResponseHeader(h.first)) continue;
            resp.addHeader(h.first, h.second);
        }
    } else {
        resp.setContentType("text/plain");
    }

    // Nothing after the forward may change what the client receives.
    try {
        const audit::RequestMetadata metadata = audit::MetadataExtractor::Extract(req->body(), req->headers());
        const std::string sanitized = audit::ResponseSanitizer::Sanitize(outcome.body);
        resp.setBody(outcome.body.empty() ? std::string() : sanitized);

        audit::EntryPtr entry = audit::EntryBuilder::Build(*req, outcome, metadata, sanitized);
        ctx_.fanout().Persist(entry);
        if (audit::ConsoleRenderer* console = ctx_.console()) {
            console->Render(*entry, req->query(), resp.body());
        }
    } catch (const std::exception& e) {
        LOG_ERROR << "AuditProxy: audit of " << req->methodString() << " " << req->path()
                  << " failed: " << e.what();
        if (resp.body().empty() && !outcome.body.empty()) {
            resp.setBody(audit::ResponseSanitizer::Sanitize(outcome.body));
        }
    }

    responder->Send(resp);
}

} // namespace codetap
