#include "codetap/network/InetAddress.h"
#include "codetap/common/Logger.h"

#include <cstring>
#include <cstdio>
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

namespace codetap {
namespace network {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    in_addr_t ip = loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY;
    addr_.sin_addr.s_addr = htonl(ip);
    addr_.sin_port = htons(port);
}

InetAddress::InetAddress(const std::string& ip, uint16_t port) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr_.sin_addr) <= 0) {
        LOG_WARN << "InetAddress: '" << ip << "' is not an IPv4 literal";
        addr_.sin_addr.s_addr = htonl(INADDR_NONE);
    }
}

std::string InetAddress::toIp() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    return buf;
}

std::string InetAddress::toIpPort() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    size_t end = std::strlen(buf);
    uint16_t port = ntohs(addr_.sin_port);
    snprintf(buf + end, sizeof buf - end, ":%u", port);
    return buf;
}

uint16_t InetAddress::toPort() const {
    return ntohs(addr_.sin_port);
}

std::optional<InetAddress> InetAddress::Resolve(const std::string& host, uint16_t port) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res) {
        LOG_WARN << "Resolve " << host << " failed: " << ::gai_strerror(rc);
        return std::nullopt;
    }

    std::optional<InetAddress> out;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        if (ai->ai_family != AF_INET || !ai->ai_addr) continue;
        struct sockaddr_in sin;
        std::memcpy(&sin, ai->ai_addr, sizeof sin);
        sin.sin_port = htons(port);
        out = InetAddress(sin);
        break;
    }
    ::freeaddrinfo(res);
    return out;
}

} // namespace network
} // namespace codetap
