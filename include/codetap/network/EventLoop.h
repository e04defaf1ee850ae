#pragma once

#include <vector>
#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <mutex>

#include "codetap/common/noncopyable.h"
#include "codetap/network/Channel.h"
#include "codetap/network/Poller.h"

namespace codetap {
namespace network {

// One reactor per thread. Everything touching a loop's channels runs on the
// loop thread; other threads hand work over with RunInLoop/QueueInLoop.
class EventLoop : codetap::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }
    bool looping() const { return looping_; }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void HandleRead(); // For wakeup
    void DoPendingFunctors();

    using ChannelList = std::vector<Channel*>;

    std::atomic_bool looping_;
    std::atomic_bool quit_;
    std::atomic_bool calling_pending_functors_;

    const std::thread::id thread_id_;
    std::unique_ptr<Poller> poller_;

    // wakeup fd
    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    ChannelList active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;
};

} // namespace network
} // namespace codetap
