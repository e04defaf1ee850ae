#include "codetap/protocol/HttpServer.h"
#include "codetap/protocol/HttpContext.h"
#include "codetap/protocol/HttpRequest.h"
#include "codetap/protocol/HttpResponse.h"
#include "codetap/network/EventLoop.h"
#include "codetap/common/Logger.h"

#include <any>

namespace codetap {
namespace protocol {

using codetap::network::Buffer;
using codetap::network::TcpConnectionPtr;

HttpServer::Responder::Responder(HttpServer* server,
                                 const TcpConnectionPtr& conn,
                                 bool close,
                                 bool headOnly)
    : server_(server),
      conn_(conn),
      loop_(conn->getLoop()),
      close_(close),
      headOnly_(headOnly),
      sent_(false) {}

void HttpServer::Responder::Send(const HttpResponse& response) {
    HttpResponse out = response;
    const bool close = close_ || out.closeConnection();
    out.setCloseConnection(close);
    out.setSuppressBody(headOnly_);

    Buffer buf;
    out.appendToBuffer(&buf);
    auto wire = std::make_shared<std::string>(buf.RetrieveAllAsString());

    auto self = shared_from_this();
    loop_->RunInLoop([self, wire, close]() { self->SendInLoop(wire, close); });
}

void HttpServer::Responder::SendInLoop(const std::shared_ptr<std::string>& wire, bool close) {
    if (sent_) {
        LOG_WARN << "HttpServer: response already sent, dropping duplicate";
        return;
    }
    sent_ = true;
    TcpConnectionPtr conn = conn_.lock();
    if (!conn || !conn->connected()) {
        LOG_DEBUG << "HttpServer: client gone before the response was ready";
        return;
    }
    conn->Send(*wire);
    server_->onResponseSent(conn, close);
}

HttpServer::HttpServer(codetap::network::EventLoop* loop,
                       const codetap::network::InetAddress& listenAddr,
                       const std::string& name)
    : server_(loop, listenAddr, name) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
}

void HttpServer::start() {
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on "
             << server_.listenAddress().toIpPort();
    server_.Start();
}

HttpServer::Session* HttpServer::GetSession(const TcpConnectionPtr& conn) {
    return std::any_cast<Session>(conn->GetMutableContext());
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(Session(maxBodyBytes_));
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn,
                           Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    Session* session = GetSession(conn);
    if (session == nullptr) return;
    if (session->closing) {
        buf->RetrieveAll();
        return;
    }
    // Keep further bytes buffered until the current request is answered.
    if (session->inFlight) return;
    processBuffered(conn, receiveTime);
}

void HttpServer::processBuffered(const TcpConnectionPtr& conn,
                                 std::chrono::system_clock::time_point receiveTime) {
    Buffer* buf = conn->inputBuffer();
    while (true) {
        Session* session = GetSession(conn);
        if (session == nullptr || session->closing || session->inFlight) return;

        if (!session->context.parseRequest(buf, receiveTime)) {
            session->closing = true;
            HttpResponse bad(true);
            bad.setStatusCode(HttpResponse::k400BadRequest);
            bad.setContentType("text/plain");
            bad.setBody("Bad Request");
            Buffer out;
            bad.appendToBuffer(&out);
            conn->Send(out.RetrieveAllAsString());
            conn->Shutdown();
            buf->RetrieveAll();
            return;
        }
        if (!session->context.gotAll()) {
            return;
        }

        HttpRequest req;
        req.swap(session->context.request());
        session->context.reset();

        const std::string connection = HttpRequest::ToLower(req.getHeader("Connection"));
        bool close = connection.find("close") != std::string::npos ||
                     (req.getVersion() == HttpRequest::kHttp10 &&
                      connection.find("keep-alive") == std::string::npos);
        if (req.bodyTooLarge()) {
            // the rest of the body is still on the wire
            close = true;
            session->closing = true;
            buf->RetrieveAll();
        }

        auto responder = std::make_shared<Responder>(this, conn, close,
                                                     req.getMethod() == HttpRequest::kHead);
        session->inFlight = true;
        session->dispatching = true;
        if (httpCallback_) {
            httpCallback_(req, responder);
        } else {
            HttpResponse response(close);
            response.setStatusCode(HttpResponse::k404NotFound);
            responder->Send(response);
        }
        session = GetSession(conn);
        if (session == nullptr) return;
        session->dispatching = false;
        if (session->inFlight || buf->ReadableBytes() == 0) {
            return;
        }
    }
}

void HttpServer::onResponseSent(const TcpConnectionPtr& conn, bool close) {
    Session* session = GetSession(conn);
    if (session == nullptr) return;
    session->inFlight = false;
    if (close) {
        session->closing = true;
        conn->Shutdown();
        return;
    }
    if (!session->dispatching && conn->inputBuffer()->ReadableBytes() > 0) {
        // answered asynchronously; resume pipelined requests
        processBuffered(conn, std::chrono::system_clock::now());
    }
}

} // namespace protocol
} // namespace codetap
