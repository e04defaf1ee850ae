#pragma once

#include "codetap/common/noncopyable.h"
#include "codetap/network/InetAddress.h"
#include "codetap/network/Callbacks.h"
#include "codetap/network/TcpConnection.h"
#include "codetap/network/EventLoopThreadPool.h"

#include <map>
#include <string>
#include <atomic>
#include <memory>

namespace codetap {
namespace network {

class EventLoop;
class Acceptor;
class Timer;

class TcpServer : codetap::common::noncopyable {
public:
    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg);
    ~TcpServer();

    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    // Actual bound address, useful after binding port 0.
    InetAddress listenAddress() const;

    void SetThreadNum(int numThreads);

    // Idle connection cleanup (0 disables).
    void SetIdleTimeout(double idleTimeoutSec);

    void Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);
    void CleanupIdleConnections();

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> threadPool_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    std::atomic_int started_;
    int next_conn_id_;
    ConnectionMap connections_;

    double idleTimeoutSec_{0.0};
    std::shared_ptr<Timer> cleanupTimer_;
};

} // namespace network
} // namespace codetap
