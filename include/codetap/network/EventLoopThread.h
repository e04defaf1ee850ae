#pragma once

#include "codetap/common/noncopyable.h"
#include <mutex>
#include <condition_variable>
#include <thread>
#include <string>

namespace codetap {
namespace network {

class EventLoop;

// Runs one EventLoop on its own thread; the destructor quits and joins it.
class EventLoopThread : codetap::common::noncopyable {
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    EventLoop* StartLoop();

    const std::string& name() const { return name_; }

private:
    void ThreadFunc();

    EventLoop* loop_;
    bool exiting_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

} // namespace network
} // namespace codetap
