#pragma once

#include "codetap/common/noncopyable.h"
#include "codetap/network/Socket.h"
#include "codetap/network/Channel.h"
#include "codetap/network/InetAddress.h"

#include <functional>

namespace codetap {
namespace network {

class EventLoop;

class Acceptor : codetap::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listenning() const { return listenning_; }
    void Listen();

    InetAddress LocalAddress() const { return accept_socket_.LocalAddress(); }

private:
    void HandleRead();

    EventLoop* loop_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool listenning_;
};

} // namespace network
} // namespace codetap
