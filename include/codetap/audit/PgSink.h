#pragma once

#include "codetap/audit/EntrySink.h"
#include "codetap/audit/PgConnectionPool.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace codetap {
namespace network {
class EventLoop;
class EventLoopThread;
}

namespace audit {

// Inserts one row per Entry into codetime_entries. A row_hash that is
// already stored makes the insert a no-op. The pool runs on its own loop.
class PgSink : public EntrySink {
public:
    struct Options {
        std::string url;
        int poolMin{1};
        int poolMax{4};
        bool createSchema{false};
    };

    static const char kSchemaSql[];
    static const char kInsertSql[];

    explicit PgSink(const Options& opts);
    ~PgSink() override;

    const char* name() const override { return "postgres"; }
    void Submit(const EntryPtr& entry) override;

    // Waits until every statement submitted so far has finished, or until
    // timeoutMs elapses. Returns false on timeout.
    bool Flush(int timeoutMs);

    // Runs one statement and waits for it; used for schema setup and tests.
    bool ExecuteSync(const std::string& sql, const PgConnectionPool::Params& params,
                     std::string* error, int timeoutMs);

    std::uint64_t submitted() const { return submitted_; }
    std::uint64_t completed() const { return completed_; }
    std::uint64_t failed() const { return failed_; }

    // Bind values for kInsertSql, in column order.
    static PgConnectionPool::Params InsertParams(const Entry& entry);

private:
    std::unique_ptr<codetap::network::EventLoopThread> thread_;
    codetap::network::EventLoop* loop_{nullptr};
    std::unique_ptr<PgConnectionPool> pool_;

    std::atomic<std::uint64_t> submitted_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> failed_{0};
};

} // namespace audit
} // namespace codetap
