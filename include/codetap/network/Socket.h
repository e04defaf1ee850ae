#pragma once

#include "codetap/common/noncopyable.h"

namespace codetap {
namespace network {

class InetAddress;

// Owns a socket fd and closes it on destruction.
class Socket : codetap::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    // Throws std::system_error when the address is unavailable.
    void BindAddress(const InetAddress& localaddr);
    void Listen();
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetKeepAlive(bool on);

    // Local address after bind; lets callers bind to port 0.
    InetAddress LocalAddress() const;

private:
    const int sockfd_;
};

} // namespace network
} // namespace codetap
