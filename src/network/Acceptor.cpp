#include "codetap/network/Acceptor.h"
#include "codetap/network/EventLoop.h"
#include "codetap/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace codetap {
namespace network {

static int CreateNonblockingOrThrow() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        int err = errno;
        LOG_FATAL << "Acceptor: socket() failed: " << std::strerror(err);
        throw std::system_error(err, std::generic_category(), "socket");
    }
    return sockfd;
}

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr)
    : loop_(loop),
      accept_socket_(CreateNonblockingOrThrow()),
      accept_channel_(loop, accept_socket_.fd()),
      listenning_(false) {

    accept_socket_.SetReuseAddr(true);
    accept_socket_.BindAddress(listenAddr);

    accept_channel_.SetReadCallback(std::bind(&Acceptor::HandleRead, this));
}

Acceptor::~Acceptor() {
    accept_channel_.DisableAll();
    accept_channel_.Remove();
}

void Acceptor::Listen() {
    listenning_ = true;
    accept_socket_.Listen();
    accept_channel_.EnableReading();
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        int err = errno;
        if (err == EAGAIN || err == EINTR) return;
        LOG_ERROR << "Acceptor::HandleRead accept failed: " << std::strerror(err);
        if (err == EMFILE) {
            LOG_ERROR << "sockfd reached limit";
        }
    }
}

} // namespace network
} // namespace codetap
