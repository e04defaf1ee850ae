#include "codetap/network/SignalWatcher.h"
#include "codetap/network/Channel.h"
#include "codetap/network/EventLoop.h"
#include "codetap/common/Logger.h"

#include <sys/signalfd.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace codetap {
namespace network {

SignalWatcher::SignalWatcher(EventLoop* loop, std::initializer_list<int> signals, SignalCallback cb)
    : loop_(loop), fd_(-1), callback_(std::move(cb)) {
    sigset_t mask;
    sigemptyset(&mask);
    for (int signo : signals) {
        sigaddset(&mask, signo);
    }
    if (::pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        LOG_ERROR << "SignalWatcher: pthread_sigmask failed";
        return;
    }
    fd_ = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd_ < 0) {
        LOG_ERROR << "SignalWatcher: signalfd failed: " << std::strerror(errno);
        return;
    }
    channel_.reset(new Channel(loop_, fd_));
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
    channel_->EnableReading();
}

SignalWatcher::~SignalWatcher() {
    if (channel_) {
        channel_->DisableAll();
        channel_->Remove();
    }
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void SignalWatcher::HandleRead() {
    struct signalfd_siginfo info;
    ssize_t n = ::read(fd_, &info, sizeof info);
    if (n != static_cast<ssize_t>(sizeof info)) return;
    LOG_INFO << "Received signal " << info.ssi_signo << " (" << ::strsignal(static_cast<int>(info.ssi_signo)) << ")";
    if (callback_) callback_(static_cast<int>(info.ssi_signo));
}

} // namespace network
} // namespace codetap
