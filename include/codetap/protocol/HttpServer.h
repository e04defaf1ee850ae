#pragma once

#include "codetap/network/TcpServer.h"
#include "codetap/common/noncopyable.h"
#include "codetap/protocol/HttpContext.h"

#include <functional>
#include <memory>

namespace codetap {
namespace protocol {

class HttpRequest;
class HttpResponse;

// HTTP/1.1 server with asynchronous handlers. The handler receives a
// Responder and may answer later from the connection's loop or any other
// thread. Requests on one connection are answered strictly in order: the
// next pipelined request is parsed only after the current one was answered.
class HttpServer : codetap::common::noncopyable {
public:
    class Responder : public std::enable_shared_from_this<Responder> {
    public:
        Responder(HttpServer* server,
                  const codetap::network::TcpConnectionPtr& conn,
                  bool close,
                  bool headOnly);

        // Forces Connection: close when the request demanded it.
        bool closeRequested() const { return close_; }

        // Sends the response once; later calls are ignored. Dropped silently
        // when the client is already gone.
        void Send(const HttpResponse& response);

    private:
        void SendInLoop(const std::shared_ptr<std::string>& wire, bool close);

        HttpServer* server_;
        std::weak_ptr<codetap::network::TcpConnection> conn_;
        codetap::network::EventLoop* loop_;
        bool close_;
        bool headOnly_;
        bool sent_;
    };

    using ResponderPtr = std::shared_ptr<Responder>;
    using HttpCallback = std::function<void(const HttpRequest&, const ResponderPtr&)>;

    HttpServer(codetap::network::EventLoop* loop,
               const codetap::network::InetAddress& listenAddr,
               const std::string& name);

    codetap::network::EventLoop* getLoop() const { return server_.getLoop(); }
    codetap::network::InetAddress listenAddress() const { return server_.listenAddress(); }

    void setHttpCallback(const HttpCallback& cb) { httpCallback_ = cb; }

    // Request bodies above this are flagged bodyTooLarge and the connection
    // is closed after the response (0 disables).
    void setMaxBodyBytes(size_t n) { maxBodyBytes_ = n; }

    void setThreadNum(int numThreads) { server_.SetThreadNum(numThreads); }
    void setIdleTimeout(double seconds) { server_.SetIdleTimeout(seconds); }

    void start();

private:
    struct Session {
        explicit Session(size_t maxBody) : context(maxBody) {}
        HttpContext context;
        bool inFlight{false};
        bool dispatching{false};
        bool closing{false};
    };

    void onConnection(const codetap::network::TcpConnectionPtr& conn);
    void onMessage(const codetap::network::TcpConnectionPtr& conn,
                   codetap::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void processBuffered(const codetap::network::TcpConnectionPtr& conn,
                         std::chrono::system_clock::time_point receiveTime);
    void onResponseSent(const codetap::network::TcpConnectionPtr& conn, bool close);

    static Session* GetSession(const codetap::network::TcpConnectionPtr& conn);

    codetap::network::TcpServer server_;
    HttpCallback httpCallback_;
    size_t maxBodyBytes_{0};
};

} // namespace protocol
} // namespace codetap
