#include "codetap/network/TcpClient.h"
#include "codetap/network/Connector.h"
#include "codetap/network/EventLoop.h"
#include "codetap/common/Logger.h"

#include <cstring>
#include <sys/socket.h>

namespace codetap {
namespace network {

namespace {

InetAddress LocalAddressOf(int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    ::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len);
    return InetAddress(addr);
}

void DestroyLater(EventLoop* loop, const TcpConnectionPtr& conn) {
    loop->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace

TcpClient::TcpClient(EventLoop* loop,
                     const InetAddress& serverAddr,
                     const std::string& nameArg,
                     ssl_ctx_st* tlsCtx,
                     const std::string& tlsServerName)
    : loop_(loop),
      connector_(std::make_shared<Connector>(loop, serverAddr)),
      name_(nameArg),
      tlsCtx_(tlsCtx),
      tlsServerName_(tlsServerName),
      nextConnId_(1) {
    connector_->SetNewConnectionCallback(
        std::bind(&TcpClient::NewConnection, this, std::placeholders::_1));
    connector_->SetErrorCallback([this](int err) {
        if (connectFailedCallback_) connectFailedCallback_(err);
    });
}

TcpClient::~TcpClient() {
    TcpConnectionPtr conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conn = connection_;
        connection_.reset();
    }
    if (conn) {
        EventLoop* loop = loop_;
        conn->SetConnectionCallback(ConnectionCallback());
        conn->SetMessageCallback([](const TcpConnectionPtr&, Buffer* buf, std::chrono::system_clock::time_point) {
            buf->RetrieveAll();
        });
        conn->SetCloseCallback([loop](const TcpConnectionPtr& c) { DestroyLater(loop, c); });
        conn->ForceClose();
    } else {
        connector_->SetNewConnectionCallback(Connector::NewConnectionCallback());
        connector_->SetErrorCallback(Connector::ErrorCallback());
        connector_->Stop();
    }
}

void TcpClient::Connect() {
    LOG_DEBUG << "TcpClient::Connect[" << name_ << "] - connecting to "
              << connector_->serverAddress().toIpPort();
    connector_->Start();
}

void TcpClient::Disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_) {
        connection_->Shutdown();
    }
}

void TcpClient::RebindCallbacks(const ConnectionCallback& connCb, const MessageCallback& msgCb) {
    connectionCallback_ = connCb;
    messageCallback_ = msgCb;
    TcpConnectionPtr conn = connection();
    if (conn) {
        // The connection callback installed by NewConnection forwards to
        // connectionCallback_, so only the message callback needs rebinding.
        conn->SetMessageCallback(msgCb);
    }
}

void TcpClient::NewConnection(int sockfd) {
    InetAddress peerAddr = connector_->serverAddress();
    std::string connName = name_ + ":" + peerAddr.toIpPort() + "#" + std::to_string(nextConnId_);
    ++nextConnId_;

    TcpConnectionPtr conn(new TcpConnection(loop_,
                                            connName,
                                            sockfd,
                                            LocalAddressOf(sockfd),
                                            peerAddr,
                                            tlsCtx_,
                                            tlsServerName_));

    // A connection that closes before it ever reported connected (TLS
    // handshake failure) counts as a failed connect.
    auto everConnected = std::make_shared<bool>(false);
    conn->SetConnectionCallback([this, everConnected](const TcpConnectionPtr& c) {
        if (c->connected()) {
            *everConnected = true;
        } else if (!*everConnected) {
            *everConnected = true;
            if (connectFailedCallback_) connectFailedCallback_(ECONNABORTED);
            return;
        }
        if (connectionCallback_) connectionCallback_(c);
    });
    conn->SetMessageCallback(messageCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpClient::RemoveConnection, this, std::placeholders::_1));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = conn;
    }
    conn->ConnectEstablished();
}

void TcpClient::RemoveConnection(const TcpConnectionPtr& conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_ == conn) connection_.reset();
    }
    DestroyLater(loop_, conn);
}

} // namespace network
} // namespace codetap
