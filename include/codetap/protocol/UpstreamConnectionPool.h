#pragma once

#include "codetap/common/noncopyable.h"
#include "codetap/network/EventLoop.h"
#include "codetap/network/InetAddress.h"
#include "codetap/network/TcpClient.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct ssl_ctx_st;

namespace codetap {
namespace protocol {

// Per-loop keep-alive pool of upstream connections, one exchange in flight
// per connection. Idle connections never leave the loop that created them.
class UpstreamConnectionPool : codetap::common::noncopyable {
public:
    struct Config {
        size_t maxIdlePerLoop{16};
        std::chrono::milliseconds maxIdleAge{std::chrono::seconds(30)};
    };

    class Lease : codetap::common::noncopyable {
    public:
        Lease(codetap::network::EventLoop* loop,
              std::string key,
              std::shared_ptr<codetap::network::TcpClient> client,
              UpstreamConnectionPool* pool,
              bool reused);
        ~Lease();

        codetap::network::TcpConnectionPtr connection() const;
        codetap::network::TcpClient* client() const { return client_.get(); }
        // true when the connection came out of the idle list
        bool reused() const { return reused_; }

        // keepAlive=true -> back to the idle list; else closed.
        void Release(bool keepAlive);

    private:
        codetap::network::EventLoop* loop_;
        std::string key_;
        std::shared_ptr<codetap::network::TcpClient> client_;
        UpstreamConnectionPool* pool_;
        bool reused_;
        bool released_{false};
    };

    // lease is null on failure, with err holding the errno-style reason.
    using AcquireCallback = std::function<void(std::shared_ptr<Lease> lease, int err)>;

    UpstreamConnectionPool();
    explicit UpstreamConnectionPool(Config cfg);
    ~UpstreamConnectionPool();

    // Must run on loop's thread. The callback may run synchronously when an
    // idle connection is available. forceNew skips the idle list.
    void Acquire(codetap::network::EventLoop* loop,
                 const codetap::network::InetAddress& addr,
                 ssl_ctx_st* tlsCtx,
                 const std::string& serverName,
                 bool forceNew,
                 AcquireCallback cb);

    size_t IdleCount(codetap::network::EventLoop* loop);

    // Closes every idle connection. Call before the loops stop.
    void Clear();

private:
    struct Idle {
        std::shared_ptr<codetap::network::TcpClient> client;
        std::chrono::steady_clock::time_point since;
    };

    struct PerLoop {
        std::unordered_map<std::string, std::vector<Idle>> idle;
    };

    void ReleaseInternal(codetap::network::EventLoop* loop,
                         const std::string& key,
                         std::shared_ptr<codetap::network::TcpClient> client,
                         bool keepAlive);
    static void DropLater(codetap::network::EventLoop* loop,
                          std::shared_ptr<codetap::network::TcpClient> client);

    Config cfg_;
    std::mutex mu_;
    std::unordered_map<codetap::network::EventLoop*, PerLoop> pools_;
};

} // namespace protocol
} // namespace codetap
