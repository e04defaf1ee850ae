#pragma once

#include "codetap/common/noncopyable.h"
#include "codetap/network/TcpConnection.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

struct ssl_ctx_st;

namespace codetap {
namespace network {

class Connector;
class EventLoop;

// Owns at most one outbound connection. Connect failures (TCP or TLS
// handshake) are reported through the connect-failed callback; there is no
// automatic reconnect. Destroy on the loop thread.
class TcpClient : codetap::common::noncopyable {
public:
    using ConnectFailedCallback = std::function<void(int err)>;

    TcpClient(EventLoop* loop,
              const InetAddress& serverAddr,
              const std::string& nameArg,
              ssl_ctx_st* tlsCtx = nullptr,
              const std::string& tlsServerName = "");
    ~TcpClient();

    void Connect();
    void Disconnect();

    TcpConnectionPtr connection() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_;
    }

    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetConnectFailedCallback(const ConnectFailedCallback& cb) { connectFailedCallback_ = cb; }

    // Rebinds the callbacks of an already established connection.
    void RebindCallbacks(const ConnectionCallback& connCb, const MessageCallback& msgCb);

private:
    void NewConnection(int sockfd);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    std::shared_ptr<Connector> connector_;
    const std::string name_;
    ssl_ctx_st* tlsCtx_;
    std::string tlsServerName_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    ConnectFailedCallback connectFailedCallback_;

    int nextConnId_;
    mutable std::mutex mutex_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace codetap
