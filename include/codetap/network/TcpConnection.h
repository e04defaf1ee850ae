#pragma once

#include "codetap/common/noncopyable.h"
#include "codetap/network/InetAddress.h"
#include "codetap/network/Callbacks.h"
#include "codetap/network/Buffer.h"

#include <memory>
#include <string>
#include <atomic>
#include <chrono>
#include <any>
#include <cstdint>

struct ssl_ctx_st;
struct ssl_st;

namespace codetap {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One established TCP stream, plain or TLS (client side). With a TLS
// context the connection callback fires only once the handshake finished;
// a failed handshake closes the connection without ever reporting connected.
class TcpConnection : codetap::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr,
                  ssl_ctx_st* tlsCtx = nullptr,
                  const std::string& tlsServerName = "");
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    Buffer* inputBuffer() { return &inputBuffer_; }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    void Shutdown();
    void ForceClose();

    std::chrono::steady_clock::time_point LastActiveTime() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called once the owner registered the connection
    void ConnectEstablished();
    // Called when the owner has removed me from its map
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };
    enum TlsState { kTlsNone, kTlsHandshake, kTlsEstablished };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void Touch();
    void MarkConnected();

    bool TlsStart();
    void TlsContinueHandshake();
    ssize_t TlsReadAll(int* savedErrno);
    ssize_t TlsWriteOnce(const void* data, size_t len, int* savedErrno);
    ssize_t WriteOnce(const void* data, size_t len, int* savedErrno);

    void SetState(StateE s) { state_ = s; }

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    CloseCallback closeCallback_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    std::atomic<std::int64_t> lastActiveNs_;

    ssl_ctx_st* tlsCtx_{nullptr};
    std::string tlsServerName_;
    ssl_st* ssl_{nullptr};
    TlsState tlsState_{kTlsNone};
};

} // namespace network
} // namespace codetap
