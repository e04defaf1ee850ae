#include "codetap/audit/Forwarder.h"
#include "codetap/protocol/HttpResponse.h"
#include "codetap/common/Logger.h"

namespace codetap {
namespace audit {

using codetap::protocol::HttpClient;
using codetap::protocol::HttpRequest;
using codetap::protocol::HttpResponse;

bool Forwarder::IsDroppedRequestHeader(const std::string& lowerName) {
    return lowerName == "host" ||
           lowerName == "content-length" ||
           lowerName == "transfer-encoding" ||
           lowerName == "connection" ||
           lowerName == "keep-alive" ||
           lowerName == "accept-encoding";
}

int Forwarder::StatusFor(HttpClient::Outcome transport) {
    switch (transport) {
        case HttpClient::kOk: return HttpResponse::k200Ok;
        case HttpClient::kTimeout: return HttpResponse::k504GatewayTimeout;
        case HttpClient::kConnectFailed:
        case HttpClient::kProtocolError:
        default:
            return HttpResponse::k502BadGateway;
    }
}

const char* Forwarder::BodyFor(HttpClient::Outcome transport) {
    switch (transport) {
        case HttpClient::kTimeout: return "Upstream request timed out";
        case HttpClient::kConnectFailed: return "Upstream unreachable";
        case HttpClient::kProtocolError: return "Upstream protocol error";
        default: return "";
    }
}

HttpClient::Request Forwarder::BuildRequest(const HttpRequest& req) const {
    HttpClient::Request out;
    out.method = req.methodString();
    out.target = client_->upstream().TargetPath(req.path());
    if (!req.query().empty()) {
        out.target.append("?").append(req.query());
    }
    out.headers.emplace_back("Host", client_->upstream().authority());
    for (const auto& h : req.headers()) {
        if (IsDroppedRequestHeader(h.first)) continue;
        out.headers.emplace_back(h.first, h.second);
    }
    out.headers.emplace_back("Accept-Encoding", "gzip, deflate");
    out.body = req.body();
    return out;
}

void Forwarder::Forward(codetap::network::EventLoop* loop, const HttpRequest& req, Callback cb) {
    HttpClient::Request upstreamReq = BuildRequest(req);
    LOG_DEBUG << "Forwarder: " << upstreamReq.method << " "
              << client_->upstream().ToString() << " " << upstreamReq.target;
    client_->Send(loop, std::move(upstreamReq), [cb](const HttpClient::Result& result) {
        Outcome outcome;
        outcome.transport = result.outcome;
        outcome.durationMs = result.durationMs;
        if (result.outcome == HttpClient::kOk) {
            outcome.status = result.status;
            outcome.headers = result.headers;
            outcome.body = result.body;
        } else {
            outcome.status = StatusFor(result.outcome);
            outcome.body = BodyFor(result.outcome);
            outcome.error = result.error;
        }
        cb(outcome);
    });
}

} // namespace audit
} // namespace codetap
