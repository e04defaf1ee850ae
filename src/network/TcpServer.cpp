#include "codetap/network/TcpServer.h"
#include "codetap/network/EventLoop.h"
#include "codetap/network/Acceptor.h"
#include "codetap/network/Timer.h"
#include "codetap/common/Logger.h"

#include <functional>
#include <vector>

namespace codetap {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg)
    : loop_(loop),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      next_conn_id_(1) {
    acceptor_->SetNewConnectionCallback(
        std::bind(&TcpServer::NewConnection, this, std::placeholders::_1, std::placeholders::_2));
}

TcpServer::~TcpServer() {
    if (cleanupTimer_) cleanupTimer_->Cancel();
    cleanupTimer_.reset();
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
    }
}

InetAddress TcpServer::listenAddress() const {
    return acceptor_->LocalAddress();
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

void TcpServer::SetIdleTimeout(double idleTimeoutSec) {
    idleTimeoutSec_ = idleTimeoutSec;
}

void TcpServer::Start() {
    if (started_++ == 0) {
        threadPool_->Start();
        if (idleTimeoutSec_ > 0.0) {
            cleanupTimer_ = std::make_shared<Timer>(loop_);
            if (!cleanupTimer_->Start(1000, 1000, [this]() { CleanupIdleConnections(); })) {
                LOG_WARN << "TcpServer [" << name_ << "] idle cleanup disabled";
            }
        }
        loop_->RunInLoop(std::bind(&Acceptor::Listen, acceptor_.get()));
    }
}

void TcpServer::CleanupIdleConnections() {
    const auto now = std::chrono::steady_clock::now();
    const auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(idleTimeoutSec_));

    std::vector<TcpConnectionPtr> toClose;
    for (auto const& [name, conn] : connections_) {
        if (conn && now - conn->LastActiveTime() > timeout) {
            LOG_DEBUG << "TcpServer [" << name_ << "] closing idle conn " << name;
            toClose.push_back(conn);
        }
    }

    for (auto& conn : toClose) {
        conn->ForceClose();
    }
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    std::string connName = name_ + "-" + peerAddr.toIpPort() + "#" + std::to_string(next_conn_id_);
    ++next_conn_id_;

    LOG_DEBUG << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName << "]";

    EventLoop* ioLoop = threadPool_->GetNextLoop();

    TcpConnectionPtr conn(new TcpConnection(ioLoop,
                                            connName,
                                            sockfd,
                                            acceptor_->LocalAddress(),
                                            peerAddr));
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpServer::RemoveConnection, this, std::placeholders::_1));

    ioLoop->RunInLoop(std::bind(&TcpConnection::ConnectEstablished, conn));
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Always defer removal to avoid re-entrancy inside TcpConnection event callbacks.
    loop_->QueueInLoop(std::bind(&TcpServer::RemoveConnectionInLoop, this, conn));
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    connections_.erase(conn->name());

    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop(
        std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace codetap
