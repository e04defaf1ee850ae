#pragma once

#include "codetap/common/noncopyable.h"

#include <functional>
#include <initializer_list>
#include <memory>

namespace codetap {
namespace network {

class Channel;
class EventLoop;

// Delivers POSIX signals as loop events through signalfd. The signals are
// blocked in the constructing thread; construct before spawning threads so
// they inherit the mask.
class SignalWatcher : codetap::common::noncopyable {
public:
    using SignalCallback = std::function<void(int signo)>;

    SignalWatcher(EventLoop* loop, std::initializer_list<int> signals, SignalCallback cb);
    ~SignalWatcher();

    bool ok() const { return fd_ >= 0; }

private:
    void HandleRead();

    EventLoop* loop_;
    int fd_;
    std::unique_ptr<Channel> channel_;
    SignalCallback callback_;
};

} // namespace network
} // namespace codetap
