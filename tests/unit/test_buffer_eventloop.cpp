#include "codetap/network/Buffer.h"
#include "codetap/network/EventLoop.h"
#include "codetap/network/EventLoopThread.h"
#include "codetap/network/SignalWatcher.h"
#include "codetap/network/Timer.h"
#include "codetap/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <csignal>
#include <future>
#include <memory>
#include <string>
#include <thread>

using namespace codetap::network;
using namespace codetap::common;

void testBuffer() {
    Buffer buf;
    assert(buf.ReadableBytes() == 0);
    assert(buf.FindCRLF() == nullptr);

    buf.Append("GET / HTTP/1.1\r\nHost: x\r\n");
    const char* crlf = buf.FindCRLF();
    assert(crlf != nullptr);
    assert(std::string(buf.Peek(), crlf) == "GET / HTTP/1.1");
    buf.RetrieveUntil(crlf + 2);
    assert(buf.RetrieveAsString(7) == "Host: x");
    buf.Retrieve(2);
    assert(buf.ReadableBytes() == 0);

    // grows past the initial capacity and keeps content intact
    const std::string big(Buffer::kInitialSize * 3, 'q');
    buf.Append(big);
    buf.Append("tail");
    assert(buf.ReadableBytes() == big.size() + 4);
    buf.Retrieve(big.size());
    assert(buf.RetrieveAllAsString() == "tail");
    LOG_INFO << "Buffer PASS";
}

void testQuitFromOtherThread() {
    EventLoop loop;
    std::atomic<bool> ran{false};
    loop.RunInLoop([&ran]() { ran = true; });

    std::thread t([&loop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        loop.Quit();
    });
    loop.Loop();
    t.join();
    assert(ran);
    LOG_INFO << "Quit from other thread PASS";
}

void testTimers() {
    EventLoop loop;
    int ticks = 0;
    bool cancelledFired = false;

    auto repeating = std::make_shared<Timer>(&loop);
    auto cancelled = std::make_shared<Timer>(&loop);
    auto stopper = std::make_shared<Timer>(&loop);

    assert(repeating->Start(10, 10, [&]() {
        if (++ticks == 3) repeating->Cancel();
    }));
    assert(cancelled->Start(50, 0, [&]() { cancelledFired = true; }));
    cancelled->Cancel();
    assert(!cancelled->armed());
    assert(stopper->Start(200, 0, [&loop]() { loop.Quit(); }));

    loop.Loop();
    assert(ticks == 3);
    assert(!cancelledFired);
    LOG_INFO << "Timers PASS";
}

void testEventLoopThread() {
    EventLoopThread thread("worker");
    EventLoop* loop = thread.StartLoop();
    assert(loop != nullptr);
    assert(!loop->IsInLoopThread());

    std::promise<bool> inLoop;
    std::future<bool> result = inLoop.get_future();
    loop->QueueInLoop([loop, &inLoop]() { inLoop.set_value(loop->IsInLoopThread()); });
    assert(result.get());
    LOG_INFO << "EventLoopThread PASS";
}

void testSignalWatcher() {
    EventLoop loop;
    int seen = 0;
    SignalWatcher watcher(&loop, {SIGUSR1}, [&](int signo) {
        seen = signo;
        loop.Quit();
    });
    assert(watcher.ok());
    loop.RunInLoop([]() { ::raise(SIGUSR1); });
    loop.Loop();
    assert(seen == SIGUSR1);
    LOG_INFO << "SignalWatcher PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::DEBUG);
    testBuffer();
    testQuitFromOtherThread();
    testTimers();
    testEventLoopThread();
    testSignalWatcher();
    return 0;
}
