#include "codetap/network/Timer.h"
#include "codetap/network/Channel.h"
#include "codetap/network/EventLoop.h"
#include "codetap/common/Logger.h"

#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace codetap {
namespace network {

namespace {

struct itimerspec ToSpec(int delayMs, int intervalMs) {
    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    // A zero it_value disarms the timer, so round up to 1ms.
    if (delayMs <= 0) delayMs = 1;
    howlong.it_value.tv_sec = delayMs / 1000;
    howlong.it_value.tv_nsec = static_cast<long>(delayMs % 1000) * 1000 * 1000;
    if (intervalMs > 0) {
        howlong.it_interval.tv_sec = intervalMs / 1000;
        howlong.it_interval.tv_nsec = static_cast<long>(intervalMs % 1000) * 1000 * 1000;
    }
    return howlong;
}

} // namespace

Timer::Timer(EventLoop* loop)
    : loop_(loop),
      timerFd_(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)),
      armed_(false),
      repeating_(false) {
    if (timerFd_ < 0) {
        LOG_ERROR << "Timer: timerfd_create failed: " << std::strerror(errno);
        return;
    }
    channel_.reset(new Channel(loop_, timerFd_));
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Timer::~Timer() {
    if (channel_) {
        channel_->DisableAll();
        channel_->Remove();
    }
    if (timerFd_ >= 0) {
        ::close(timerFd_);
    }
}

bool Timer::Start(int delayMs, int intervalMs, Callback cb) {
    if (timerFd_ < 0) return false;

    struct itimerspec howlong = ToSpec(delayMs, intervalMs);
    if (::timerfd_settime(timerFd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Timer: timerfd_settime failed: " << std::strerror(errno);
        return false;
    }
    callback_ = std::move(cb);
    armed_ = true;
    repeating_ = intervalMs > 0;
    channel_->Tie(shared_from_this());
    if (!channel_->IsReading()) channel_->EnableReading();
    return true;
}

void Timer::Cancel() {
    if (!armed_) return;
    armed_ = false;
    struct itimerspec off;
    std::memset(&off, 0, sizeof off);
    ::timerfd_settime(timerFd_, 0, &off, nullptr);
    if (channel_->IsReading()) channel_->DisableReading();
    callback_ = nullptr;
}

void Timer::HandleRead() {
    uint64_t expirations = 0;
    ssize_t n = ::read(timerFd_, &expirations, sizeof expirations);
    if (n != sizeof expirations || !armed_) return;

    Callback cb = callback_;
    if (!repeating_) {
        Cancel();
    }
    if (cb) cb();
}

} // namespace network
} // namespace codetap
