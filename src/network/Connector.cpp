#include "codetap/network/Connector.h"
#include "codetap/network/Channel.h"
#include "codetap/network/EventLoop.h"
#include "codetap/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>

namespace codetap {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop),
      serverAddr_(serverAddr),
      connect_(false),
      state_(kDisconnected) {
}

Connector::~Connector() {
    if (channel_) {
        LOG_WARN << "Connector to " << serverAddr_.toIpPort() << " destroyed while connecting";
    }
}

void Connector::Start() {
    connect_ = true;
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartInLoop(); });
}

void Connector::StartInLoop() {
    if (connect_) {
        Connect();
    } else {
        LOG_DEBUG << "Connector::StartInLoop - stop";
    }
}

void Connector::Stop() {
    connect_ = false;
    auto self = shared_from_this();
    loop_->QueueInLoop([self]() { self->StopInLoop(); });
}

void Connector::StopInLoop() {
    if (state_ == kConnecting) {
        SetState(kDisconnected);
        int sockfd = RemoveAndResetChannel();
        ::close(sockfd);
    }
}

void Connector::Connect() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        int err = errno;
        LOG_ERROR << "Connector::Connect socket: " << std::strerror(err);
        if (errorCallback_) errorCallback_(err);
        return;
    }

    int ret = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    int savedErrno = (ret == 0) ? 0 : errno;

    switch (savedErrno) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            Connecting(sockfd);
            break;

        default:
            Fail(sockfd, savedErrno);
            break;
    }
}

void Connector::Connecting(int sockfd) {
    SetState(kConnecting);
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback(std::bind(&Connector::HandleWrite, this));
    channel_->SetErrorCallback(std::bind(&Connector::HandleError, this));
    channel_->Tie(shared_from_this());
    channel_->EnableWriting();
}

int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    int sockfd = channel_->fd();
    // Can't reset channel_ here because we are inside Channel::HandleEvent
    auto self = shared_from_this();
    loop_->QueueInLoop([self]() { self->ResetChannel(); });
    return sockfd;
}

void Connector::ResetChannel() {
    channel_.reset();
}

void Connector::HandleWrite() {
    if (state_ != kConnecting) return;

    int sockfd = RemoveAndResetChannel();
    int err = 0;
    socklen_t len = sizeof err;
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        err = errno;
    }

    if (err) {
        Fail(sockfd, err);
        return;
    }

    SetState(kConnected);
    if (connect_ && newConnectionCallback_) {
        newConnectionCallback_(sockfd);
    } else {
        ::close(sockfd);
    }
}

void Connector::HandleError() {
    if (state_ != kConnecting) return;

    int sockfd = RemoveAndResetChannel();
    int err = 0;
    socklen_t len = sizeof err;
    ::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len);
    Fail(sockfd, err ? err : ECONNREFUSED);
}

void Connector::Fail(int sockfd, int err) {
    ::close(sockfd);
    SetState(kDisconnected);
    LOG_WARN << "Connector: connect to " << serverAddr_.toIpPort() << " failed: " << std::strerror(err);
    if (connect_ && errorCallback_) {
        errorCallback_(err);
    }
}

} // namespace network
} // namespace codetap
