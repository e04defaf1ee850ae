#pragma once

#include "codetap/common/noncopyable.h"
#include "codetap/network/InetAddress.h"

#include <functional>
#include <memory>

namespace codetap {
namespace network {

class Channel;
class EventLoop;

// One non-blocking connect attempt. Exactly one of the two callbacks fires,
// unless Stop() was called first. Failed attempts are not retried.
class Connector : public std::enable_shared_from_this<Connector>,
                  codetap::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;
    using ErrorCallback = std::function<void(int err)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        newConnectionCallback_ = cb;
    }
    void SetErrorCallback(const ErrorCallback& cb) { errorCallback_ = cb; }

    void Start();
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };

    void SetState(States s) { state_ = s; }
    void StartInLoop();
    void StopInLoop();
    void Connect();
    void Connecting(int sockfd);
    void HandleWrite();
    void HandleError();
    void Fail(int sockfd, int err);
    int RemoveAndResetChannel();
    void ResetChannel();

    EventLoop* loop_;
    InetAddress serverAddr_;
    bool connect_;
    States state_;
    std::unique_ptr<Channel> channel_;
    NewConnectionCallback newConnectionCallback_;
    ErrorCallback errorCallback_;
};

} // namespace network
} // namespace codetap
