#include "codetap/network/TcpConnection.h"
#include "codetap/network/Socket.h"
#include "codetap/network/Channel.h"
#include "codetap/network/EventLoop.h"
#include "codetap/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <sys/socket.h>

namespace codetap {
namespace network {

namespace {

std::int64_t ToSteadyNs(std::chrono::steady_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

std::chrono::steady_clock::time_point FromSteadyNs(std::int64_t ns) {
    return std::chrono::steady_clock::time_point(std::chrono::nanoseconds(ns));
}

std::string LastTlsError() {
    unsigned long le = ERR_get_error();
    if (le == 0) return "unknown";
    char buf[256];
    ERR_error_string_n(le, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

// Retry marker for TLS reads/writes that need another readiness event.
const ssize_t kTlsWouldBlock = -2;

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             ssl_ctx_st* tlsCtx,
                             const std::string& tlsServerName)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      tlsCtx_(tlsCtx),
      tlsServerName_(tlsServerName) {

    channel_->SetReadCallback(
        std::bind(&TcpConnection::HandleRead, this, std::placeholders::_1));
    channel_->SetWriteCallback(
        std::bind(&TcpConnection::HandleWrite, this));
    channel_->SetCloseCallback(
        std::bind(&TcpConnection::HandleClose, this));
    channel_->SetErrorCallback(
        std::bind(&TcpConnection::HandleError, this));

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] at " << this << " fd=" << sockfd;
    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
    lastActiveNs_.store(ToSteadyNs(std::chrono::steady_clock::now()), std::memory_order_relaxed);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] at " << this << " fd=" << channel_->fd()
              << " state=" << state_;
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
}

void TcpConnection::ConnectEstablished() {
    channel_->Tie(shared_from_this());
    channel_->EnableReading();
    Touch();

    if (tlsCtx_) {
        if (!TlsStart()) {
            HandleClose();
            return;
        }
        TlsContinueHandshake();
        return;
    }
    MarkConnected();
}

void TcpConnection::MarkConnected() {
    SetState(kConnected);
    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

bool TcpConnection::TlsStart() {
    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(tlsCtx_));
    if (!s) {
        LOG_WARN << "TLS[" << name_ << "]: SSL_new failed: " << LastTlsError();
        return false;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_connect_state(s);
    if (!tlsServerName_.empty()) {
        SSL_set_tlsext_host_name(s, tlsServerName_.c_str());
        if (SSL_set1_host(s, tlsServerName_.c_str()) != 1) {
            LOG_WARN << "TLS[" << name_ << "]: cannot pin host name " << tlsServerName_;
            SSL_free(s);
            return false;
        }
    }
    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = kTlsHandshake;
    return true;
}

void TcpConnection::TlsContinueHandshake() {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_connect(s);
    if (r == 1) {
        tlsState_ = kTlsEstablished;
        if (channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
        }
        LOG_DEBUG << "TLS[" << name_ << "] established " << SSL_get_version(s);
        MarkConnected();
        return;
    }
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) {
        if (channel_->IsWriting()) channel_->DisableWriting();
        return;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return;
    }
    long verify = SSL_get_verify_result(s);
    if (verify != X509_V_OK) {
        LOG_WARN << "TLS[" << name_ << "] handshake failed: certificate "
                 << X509_verify_cert_error_string(verify);
    } else {
        LOG_WARN << "TLS[" << name_ << "] handshake failed: " << LastTlsError();
    }
    HandleClose();
}

ssize_t TcpConnection::TlsReadAll(int* savedErrno) {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    char tmp[16 * 1024];
    ssize_t total = 0;
    for (;;) {
        const int r = SSL_read(s, tmp, static_cast<int>(sizeof tmp));
        if (r > 0) {
            inputBuffer_.Append(tmp, static_cast<size_t>(r));
            total += r;
            continue;
        }
        const int e = SSL_get_error(s, r);
        if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
            return total > 0 ? total : kTlsWouldBlock;
        }
        if (e == SSL_ERROR_ZERO_RETURN) {
            // Deliver what arrived before close_notify; the next read sees 0.
            return total;
        }
        if (total > 0) return total;
        LOG_DEBUG << "TLS[" << name_ << "] read failed: " << LastTlsError();
        *savedErrno = EIO;
        return -1;
    }
}

ssize_t TcpConnection::TlsWriteOnce(const void* data, size_t len, int* savedErrno) {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_write(s, data, static_cast<int>(len));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) return kTlsWouldBlock;
    *savedErrno = EIO;
    LOG_DEBUG << "TLS[" << name_ << "] write failed: " << LastTlsError();
    return -1;
}

ssize_t TcpConnection::WriteOnce(const void* data, size_t len, int* savedErrno) {
    if (tlsState_ == kTlsEstablished) {
        return TlsWriteOnce(data, len, savedErrno);
    }
    ssize_t n = ::send(channel_->fd(), data, len, MSG_NOSIGNAL);
    if (n < 0) {
        *savedErrno = errno;
        if (errno == EWOULDBLOCK || errno == EAGAIN) return kTlsWouldBlock;
    }
    return n;
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (tlsState_ == kTlsHandshake) {
        TlsContinueHandshake();
        return;
    }

    int savedErrno = 0;
    ssize_t n = 0;
    if (tlsState_ == kTlsEstablished) {
        n = TlsReadAll(&savedErrno);
        if (n == kTlsWouldBlock) return;
    } else {
        n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    }

    if (n > 0) {
        Touch();
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else {
        if (savedErrno == EAGAIN || savedErrno == EINTR) return;
        LOG_DEBUG << "TcpConnection::HandleRead[" << name_ << "] " << std::strerror(savedErrno);
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (tlsState_ == kTlsHandshake) {
        TlsContinueHandshake();
        return;
    }

    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }

    int savedErrno = 0;
    ssize_t n = WriteOnce(outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), &savedErrno);
    if (n == kTlsWouldBlock) return;
    if (n > 0) {
        Touch();
        outputBuffer_.Retrieve(n);
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            if (writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
            if (state_ == kDisconnecting) {
                ShutdownInLoop();
            }
        }
    } else {
        LOG_DEBUG << "TcpConnection::HandleWrite[" << name_ << "] " << std::strerror(savedErrno);
        HandleClose();
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "fd = " << channel_->fd() << " state = " << state_;
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }

    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    int err = 0;
    int optval;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    if (::getsockopt(channel_->fd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        err = errno;
    } else {
        err = optval;
    }
    LOG_DEBUG << "TcpConnection::HandleError name:" << name_ << " - SO_ERROR:" << err;
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ == kConnected) {
        if (loop_->IsInLoopThread()) {
            SendInLoop(data, len);
        } else {
            std::string msg(static_cast<const char*>(data), len);
            loop_->RunInLoop([ptr = shared_from_this(), msg = std::move(msg)]() {
                ptr->SendInLoop(msg.data(), msg.size());
            });
        }
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    ssize_t nwrote = 0;
    size_t remaining = len;

    if (state_ == kDisconnected) {
        LOG_DEBUG << "disconnected, give up writing";
        return;
    }

    // if nothing in output queue, try write directly
    if (!channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        int savedErrno = 0;
        nwrote = WriteOnce(data, len, &savedErrno);
        if (nwrote >= 0) {
            Touch();
            remaining = len - nwrote;
            if (remaining == 0 && writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
        } else if (nwrote == kTlsWouldBlock) {
            nwrote = 0;
        } else {
            LOG_DEBUG << "TcpConnection::SendInLoop[" << name_ << "] " << std::strerror(savedErrno);
            HandleClose();
            return;
        }
    }

    if (remaining > 0) {
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([conn = shared_from_this()]() { conn->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (!channel_->IsWriting()) {
        if (ssl_ && tlsState_ == kTlsEstablished) {
            SSL_shutdown(reinterpret_cast<SSL*>(ssl_));
        }
        socket_->ShutdownWrite();
    }
}

void TcpConnection::ForceClose() {
    if (state_ != kDisconnected) {
        loop_->QueueInLoop([conn = shared_from_this()]() {
            conn->ForceCloseInLoop();
        });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ != kDisconnected) {
        HandleClose();
    }
}

void TcpConnection::Touch() {
    lastActiveNs_.store(ToSteadyNs(std::chrono::steady_clock::now()), std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point TcpConnection::LastActiveTime() const {
    return FromSteadyNs(lastActiveNs_.load(std::memory_order_relaxed));
}

} // namespace network
} // namespace codetap
