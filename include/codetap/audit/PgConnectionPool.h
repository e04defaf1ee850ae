#pragma once

#include "codetap/common/noncopyable.h"

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codetap {
namespace network {
class EventLoop;
}

namespace audit {

// Bounded pool of non-blocking libpq connections driven by one EventLoop.
// Statements queue FIFO while every connection is busy; broken connections
// are dropped and replaced on demand. All state lives on the loop thread;
// Execute may be called from anywhere.
class PgConnectionPool : codetap::common::noncopyable {
public:
    struct Options {
        std::string conninfo;
        int minConnections{1};
        int maxConnections{4};
        size_t maxQueued{10000};
    };

    // nullopt binds SQL NULL
    using Params = std::vector<std::optional<std::string>>;
    // ok=false carries the server or driver message
    using Callback = std::function<void(bool ok, const std::string& error)>;

    PgConnectionPool(codetap::network::EventLoop* loop, Options opts);
    ~PgConnectionPool();

    // Opens the minimum number of connections.
    void Start();

    // Without params the text may hold several statements.
    void Execute(const std::string& sql, Params params, Callback cb);

    // Loop thread only. Fails queued and running statements, closes everything.
    void Stop();

    // Loop thread only.
    bool Idle() const;
    size_t connectionCount() const { return conns_.size(); }

private:
    struct Connection;
    using ConnectionPtr = std::shared_ptr<Connection>;

    struct Statement {
        std::string sql;
        Params params;
        Callback cb;
    };

    void ExecuteInLoop(Statement st);
    void Dispatch();
    void OpenConnection();
    void ContinueConnect(const ConnectionPtr& c);
    void WatchSocket(const ConnectionPtr& c, bool wantWrite);
    void OnSocketEvent(const ConnectionPtr& c);
    void SendStatement(const ConnectionPtr& c, Statement st);
    void DrainResults(const ConnectionPtr& c);
    void FinishStatement(const ConnectionPtr& c);
    void Discard(const ConnectionPtr& c, const std::string& why);
    void ConnectFailed(const ConnectionPtr& c, const std::string& why);
    void FailAllPending(const std::string& why);

    codetap::network::EventLoop* loop_;
    Options opts_;
    std::vector<ConnectionPtr> conns_;
    std::deque<Statement> queue_;
    bool stopped_{false};
};

} // namespace audit
} // namespace codetap
