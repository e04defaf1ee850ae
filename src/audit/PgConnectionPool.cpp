#include "codetap/audit/PgConnectionPool.h"
#include "codetap/network/Channel.h"
#include "codetap/network/EventLoop.h"
#include "codetap/common/Logger.h"

#include <libpq-fe.h>

#include <algorithm>

namespace codetap {
namespace audit {

using codetap::network::Channel;

namespace {

std::string TrimMessage(const char* msg) {
    std::string s = msg ? msg : "";
    while (!s.empty() && (s.back() == '\n' || s.back() == ' ')) s.pop_back();
    return s;
}

} // namespace

struct PgConnectionPool::Connection {
    enum State { kConnecting, kIdle, kBusy, kClosed };

    ~Connection() {
        Detach();
        if (conn) PQfinish(conn);
    }

    // Unregisters the channel once; the Channel object itself may still be
    // running a callback and is destroyed with the connection.
    void Detach() {
        if (channel && !detached) {
            channel->DisableAll();
            channel->Remove();
        }
        detached = true;
    }

    PGconn* conn{nullptr};
    int fd{-1};
    std::unique_ptr<Channel> channel;
    bool detached{false};
    State state{kConnecting};
    std::optional<Statement> current;
    bool statementOk{true};
    std::string statementError;
};

PgConnectionPool::PgConnectionPool(codetap::network::EventLoop* loop, Options opts)
    : loop_(loop), opts_(std::move(opts)) {
    opts_.maxConnections = std::max(1, opts_.maxConnections);
    opts_.minConnections = std::min(std::max(0, opts_.minConnections), opts_.maxConnections);
}

PgConnectionPool::~PgConnectionPool() {
    if (!stopped_) {
        Stop();
    }
}

void PgConnectionPool::Start() {
    loop_->RunInLoop([this]() {
        for (int i = 0; i < opts_.minConnections; ++i) {
            OpenConnection();
        }
    });
}

void PgConnectionPool::Execute(const std::string& sql, Params params, Callback cb) {
    Statement st{sql, std::move(params), std::move(cb)};
    loop_->RunInLoop([this, st]() mutable { ExecuteInLoop(std::move(st)); });
}

void PgConnectionPool::ExecuteInLoop(Statement st) {
    if (stopped_) {
        if (st.cb) st.cb(false, "connection pool stopped");
        return;
    }
    if (queue_.size() >= opts_.maxQueued) {
        if (st.cb) st.cb(false, "statement queue full");
        return;
    }
    queue_.push_back(std::move(st));
    Dispatch();
}

bool PgConnectionPool::Idle() const {
    if (!queue_.empty()) return false;
    for (const auto& c : conns_) {
        if (c->state == Connection::kBusy) return false;
    }
    return true;
}

void PgConnectionPool::Dispatch() {
    if (stopped_) return;
    for (size_t i = 0; i < conns_.size() && !queue_.empty(); ++i) {
        ConnectionPtr c = conns_[i];
        if (c->state != Connection::kIdle) continue;
        Statement st = std::move(queue_.front());
        queue_.pop_front();
        SendStatement(c, std::move(st));
    }
    if (queue_.empty()) return;

    size_t connecting = 0;
    for (const auto& c : conns_) {
        if (c->state == Connection::kConnecting) ++connecting;
    }
    while (connecting < queue_.size() &&
           conns_.size() < static_cast<size_t>(opts_.maxConnections)) {
        OpenConnection();
        ++connecting;
    }
}

void PgConnectionPool::OpenConnection() {
    auto c = std::make_shared<Connection>();
    c->conn = PQconnectStart(opts_.conninfo.c_str());
    if (c->conn == nullptr) {
        ConnectFailed(c, "out of memory allocating PGconn");
        return;
    }
    if (PQstatus(c->conn) == CONNECTION_BAD) {
        ConnectFailed(c, TrimMessage(PQerrorMessage(c->conn)));
        return;
    }
    conns_.push_back(c);
    LOG_DEBUG << "PgConnectionPool: connecting (" << conns_.size() << "/" << opts_.maxConnections << ")";
    // libpq wants to write first
    WatchSocket(c, true);
}

void PgConnectionPool::WatchSocket(const ConnectionPtr& c, bool wantWrite) {
    const int fd = PQsocket(c->conn);
    if (fd < 0) {
        Discard(c, "connection has no socket");
        return;
    }
    if (fd != c->fd || !c->channel) {
        // the socket can change while libpq walks through candidate hosts
        if (c->channel) {
            c->Detach();
            std::shared_ptr<Channel> retired(std::move(c->channel));
            loop_->QueueInLoop([retired]() {});
        }
        c->detached = false;
        c->fd = fd;
        c->channel.reset(new Channel(loop_, fd));
        c->channel->Tie(c);
        std::weak_ptr<Connection> weak = c;
        auto handler = [this, weak]() {
            if (ConnectionPtr self = weak.lock()) OnSocketEvent(self);
        };
        c->channel->SetReadCallback([handler](std::chrono::system_clock::time_point) { handler(); });
        c->channel->SetWriteCallback(handler);
        c->channel->SetCloseCallback(handler);
        c->channel->SetErrorCallback(handler);
        c->channel->EnableReading();
    }
    if (wantWrite && !c->channel->IsWriting()) {
        c->channel->EnableWriting();
    } else if (!wantWrite && c->channel->IsWriting()) {
        c->channel->DisableWriting();
    }
}

void PgConnectionPool::ContinueConnect(const ConnectionPtr& c) {
    switch (PQconnectPoll(c->conn)) {
        case PGRES_POLLING_READING:
            WatchSocket(c, false);
            break;
        case PGRES_POLLING_WRITING:
            WatchSocket(c, true);
            break;
        case PGRES_POLLING_OK:
            if (PQsetnonblocking(c->conn, 1) != 0) {
                Discard(c, TrimMessage(PQerrorMessage(c->conn)));
                return;
            }
            c->state = Connection::kIdle;
            WatchSocket(c, false);
            LOG_INFO << "PgConnectionPool: connected to " << TrimMessage(PQhost(c->conn)) << ":" << TrimMessage(PQport(c->conn))
                     << " (" << conns_.size() << "/" << opts_.maxConnections << ")";
            Dispatch();
            break;
        case PGRES_POLLING_FAILED:
        default:
            ConnectFailed(c, TrimMessage(PQerrorMessage(c->conn)));
            break;
    }
}

void PgConnectionPool::OnSocketEvent(const ConnectionPtr& c) {
    if (c->state == Connection::kClosed) return;
    if (c->state == Connection::kConnecting) {
        ContinueConnect(c);
        return;
    }
    if (c->state == Connection::kBusy) {
        const int flushed = PQflush(c->conn);
        if (flushed < 0) {
            Discard(c, TrimMessage(PQerrorMessage(c->conn)));
            return;
        }
        WatchSocket(c, flushed == 1);
        if (c->state == Connection::kClosed) return;
    }
    if (PQconsumeInput(c->conn) == 0 || PQstatus(c->conn) == CONNECTION_BAD) {
        Discard(c, TrimMessage(PQerrorMessage(c->conn)));
        return;
    }
    if (c->state == Connection::kBusy) {
        DrainResults(c);
    } else {
        // notices or a server-side close on an idle connection
        while (PGresult* r = PQgetResult(c->conn)) PQclear(r);
    }
}

void PgConnectionPool::SendStatement(const ConnectionPtr& c, Statement st) {
    int sent = 0;
    if (st.params.empty()) {
        sent = PQsendQuery(c->conn, st.sql.c_str());
    } else {
        std::vector<const char*> values;
        values.reserve(st.params.size());
        for (const auto& p : st.params) {
            values.push_back(p ? p->c_str() : nullptr);
        }
        sent = PQsendQueryParams(c->conn, st.sql.c_str(), static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    }
    c->current = std::move(st);
    c->statementOk = true;
    c->statementError.clear();
    c->state = Connection::kBusy;
    if (sent == 0) {
        Discard(c, TrimMessage(PQerrorMessage(c->conn)));
        return;
    }
    const int flushed = PQflush(c->conn);
    if (flushed < 0) {
        Discard(c, TrimMessage(PQerrorMessage(c->conn)));
        return;
    }
    WatchSocket(c, flushed == 1);
}

void PgConnectionPool::DrainResults(const ConnectionPtr& c) {
    while (!PQisBusy(c->conn)) {
        PGresult* r = PQgetResult(c->conn);
        if (r == nullptr) {
            FinishStatement(c);
            return;
        }
        const ExecStatusType status = PQresultStatus(r);
        if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK && status != PGRES_EMPTY_QUERY) {
            c->statementOk = false;
            c->statementError = TrimMessage(PQresultErrorMessage(r));
        }
        PQclear(r);
    }
}

void PgConnectionPool::FinishStatement(const ConnectionPtr& c) {
    std::optional<Statement> st = std::move(c->current);
    c->current.reset();
    c->state = Connection::kIdle;
    if (st && st->cb) st->cb(c->statementOk, c->statementError);
    Dispatch();
}

void PgConnectionPool::Discard(const ConnectionPtr& c, const std::string& why) {
    LOG_WARN << "PgConnectionPool: dropping connection: " << why;
    conns_.erase(std::remove(conns_.begin(), conns_.end(), c), conns_.end());
    c->state = Connection::kClosed;
    c->Detach();
    std::optional<Statement> st = std::move(c->current);
    c->current.reset();
    if (st && st->cb) st->cb(false, why);
    Dispatch();
}

void PgConnectionPool::ConnectFailed(const ConnectionPtr& c, const std::string& why) {
    LOG_ERROR << "PgConnectionPool: connect failed: " << why;
    conns_.erase(std::remove(conns_.begin(), conns_.end(), c), conns_.end());
    c->state = Connection::kClosed;
    c->Detach();
    // with nothing left that could serve them, queued statements fail now
    if (conns_.empty()) {
        FailAllPending(why);
    }
}

void PgConnectionPool::FailAllPending(const std::string& why) {
    std::deque<Statement> pending;
    pending.swap(queue_);
    for (auto& st : pending) {
        if (st.cb) st.cb(false, why);
    }
}

void PgConnectionPool::Stop() {
    stopped_ = true;
    std::vector<ConnectionPtr> conns;
    conns.swap(conns_);
    for (auto& c : conns) {
        c->state = Connection::kClosed;
        c->Detach();
        std::optional<Statement> st = std::move(c->current);
        c->current.reset();
        if (st && st->cb) st->cb(false, "connection pool stopped");
    }
    conns.clear();
    FailAllPending("connection pool stopped");
}

} // namespace audit
} // namespace codetap
