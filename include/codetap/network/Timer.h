#pragma once

#include "codetap/common/noncopyable.h"

#include <functional>
#include <memory>

namespace codetap {
namespace network {

class Channel;
class EventLoop;

// timerfd on a loop channel. Owned through std::shared_ptr so the callback may
// release the last reference; create, start, cancel and destroy on the loop
// thread.
class Timer : codetap::common::noncopyable,
              public std::enable_shared_from_this<Timer> {
public:
    using Callback = std::function<void()>;

    explicit Timer(EventLoop* loop);
    ~Timer();

    // intervalMs == 0 -> one-shot. Returns false if the timerfd cannot be armed.
    bool Start(int delayMs, int intervalMs, Callback cb);
    void Cancel();

    bool armed() const { return armed_; }

private:
    void HandleRead();

    EventLoop* loop_;
    int timerFd_;
    std::unique_ptr<Channel> channel_;
    Callback callback_;
    bool armed_;
    bool repeating_;
};

} // namespace network
} // namespace codetap
