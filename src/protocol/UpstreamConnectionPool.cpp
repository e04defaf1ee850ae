#include "codetap/protocol/UpstreamConnectionPool.h"
#include "codetap/common/Logger.h"

#include <cerrno>
#include <utility>

namespace codetap {
namespace protocol {

using codetap::network::EventLoop;
using codetap::network::TcpClient;
using codetap::network::TcpConnectionPtr;

namespace {

// Parked connections only watch for the peer closing or sending junk.
void ParkCallbacks(TcpClient* client) {
    client->RebindCallbacks(
        [](const TcpConnectionPtr&) {},
        [](const TcpConnectionPtr& conn, codetap::network::Buffer* buf, std::chrono::system_clock::time_point) {
            LOG_DEBUG << "UpstreamConnectionPool: unexpected bytes on idle " << conn->name();
            buf->RetrieveAll();
            conn->ForceClose();
        });
}

} // namespace

UpstreamConnectionPool::Lease::Lease(EventLoop* loop,
                                     std::string key,
                                     std::shared_ptr<TcpClient> client,
                                     UpstreamConnectionPool* pool,
                                     bool reused)
    : loop_(loop), key_(std::move(key)), client_(std::move(client)), pool_(pool), reused_(reused) {
}

UpstreamConnectionPool::Lease::~Lease() {
    Release(false);
}

TcpConnectionPtr UpstreamConnectionPool::Lease::connection() const {
    if (!client_) return {};
    return client_->connection();
}

void UpstreamConnectionPool::Lease::Release(bool keepAlive) {
    if (released_) return;
    released_ = true;
    if (!pool_) return;
    pool_->ReleaseInternal(loop_, key_, std::move(client_), keepAlive);
}

UpstreamConnectionPool::UpstreamConnectionPool() : cfg_() {}

UpstreamConnectionPool::UpstreamConnectionPool(Config cfg) : cfg_(cfg) {}

UpstreamConnectionPool::~UpstreamConnectionPool() {
    Clear();
}

void UpstreamConnectionPool::DropLater(EventLoop* loop, std::shared_ptr<TcpClient> client) {
    if (!client) return;
    client->Disconnect();
    if (loop->looping()) {
        // never destroy a client from inside one of its own callbacks
        loop->QueueInLoop([client]() mutable { client.reset(); });
    }
}

void UpstreamConnectionPool::Acquire(EventLoop* loop,
                                     const codetap::network::InetAddress& addr,
                                     ssl_ctx_st* tlsCtx,
                                     const std::string& serverName,
                                     bool forceNew,
                                     AcquireCallback cb) {
    const std::string key = (tlsCtx ? "tls:" : "tcp:") + serverName + "@" + addr.toIpPort();

    if (!forceNew) {
        std::shared_ptr<TcpClient> reusable;
        {
            std::lock_guard<std::mutex> lock(mu_);
            auto& idle = pools_[loop].idle[key];
            const auto now = std::chrono::steady_clock::now();
            while (!idle.empty()) {
                Idle entry = std::move(idle.back());
                idle.pop_back();
                auto conn = entry.client ? entry.client->connection() : TcpConnectionPtr();
                if (conn && conn->connected() && now - entry.since < cfg_.maxIdleAge) {
                    reusable = std::move(entry.client);
                    break;
                }
                DropLater(loop, std::move(entry.client));
            }
        }
        if (reusable) {
            LOG_DEBUG << "UpstreamConnectionPool: reusing " << reusable->connection()->name();
            cb(std::make_shared<Lease>(loop, key, std::move(reusable), this, true), 0);
            return;
        }
    }

    struct Pending {
        AcquireCallback cb;
        std::shared_ptr<TcpClient> client;
        bool done{false};
    };
    auto client = std::make_shared<TcpClient>(loop, addr, "upstream", tlsCtx, serverName);
    auto pending = std::make_shared<Pending>();
    pending->cb = std::move(cb);
    pending->client = client;

    client->SetConnectionCallback([this, loop, key, pending](const TcpConnectionPtr& c) {
        if (pending->done) return;
        pending->done = true;
        std::shared_ptr<TcpClient> owned = std::move(pending->client);
        AcquireCallback done = std::move(pending->cb);
        if (c->connected()) {
            done(std::make_shared<Lease>(loop, key, std::move(owned), this, false), 0);
        } else {
            done(nullptr, ECONNRESET);
            DropLater(loop, std::move(owned));
        }
    });
    client->SetConnectFailedCallback([loop, pending](int err) {
        if (pending->done) return;
        pending->done = true;
        std::shared_ptr<TcpClient> owned = std::move(pending->client);
        AcquireCallback done = std::move(pending->cb);
        done(nullptr, err);
        DropLater(loop, std::move(owned));
    });
    client->Connect();
}

void UpstreamConnectionPool::ReleaseInternal(EventLoop* loop,
                                             const std::string& key,
                                             std::shared_ptr<TcpClient> client,
                                             bool keepAlive) {
    if (!client) return;
    auto conn = client->connection();
    if (!keepAlive || !conn || !conn->connected()) {
        if (conn) conn->ForceClose();
        DropLater(loop, std::move(client));
        return;
    }

    ParkCallbacks(client.get());
    std::lock_guard<std::mutex> lock(mu_);
    auto& perLoop = pools_[loop];
    size_t total = 0;
    for (const auto& kv : perLoop.idle) total += kv.second.size();
    if (total >= cfg_.maxIdlePerLoop) {
        conn->ForceClose();
        DropLater(loop, std::move(client));
        return;
    }
    perLoop.idle[key].push_back(Idle{std::move(client), std::chrono::steady_clock::now()});
}

size_t UpstreamConnectionPool::IdleCount(EventLoop* loop) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = pools_.find(loop);
    if (it == pools_.end()) return 0;
    size_t total = 0;
    for (const auto& kv : it->second.idle) total += kv.second.size();
    return total;
}

void UpstreamConnectionPool::Clear() {
    std::unordered_map<EventLoop*, PerLoop> pools;
    {
        std::lock_guard<std::mutex> lock(mu_);
        pools.swap(pools_);
    }
    for (auto& loopEntry : pools) {
        EventLoop* loop = loopEntry.first;
        for (auto& kv : loopEntry.second.idle) {
            for (auto& entry : kv.second) {
                DropLater(loop, std::move(entry.client));
            }
        }
    }
}

} // namespace protocol
} // namespace codetap
