#include "codetap/audit/PgSink.h"
#include "codetap/audit/EntryBuilder.h"
#include "codetap/network/EventLoop.h"
#include "codetap/network/EventLoopThread.h"
#include "codetap/common/Logger.h"

#include <chrono>
#include <cstdio>
#include <future>
#include <thread>
#include <utility>

namespace codetap {
namespace audit {

const char PgSink::kSchemaSql[] =
    "CREATE TABLE IF NOT EXISTS codetime_entries ("
    " id BIGSERIAL PRIMARY KEY,"
    " row_hash TEXT UNIQUE NOT NULL,"
    " entry_time TIMESTAMPTZ NOT NULL,"
    " method TEXT NOT NULL,"
    " path TEXT NOT NULL,"
    " query JSONB,"
    " request_headers JSONB,"
    " request_body TEXT,"
    " response_status INTEGER NOT NULL,"
    " response_headers JSONB,"
    " response_body TEXT,"
    " duration_ms DOUBLE PRECISION NOT NULL,"
    " auth_header TEXT,"
    " client_ip TEXT,"
    " user_agent TEXT,"
    " windows_username TEXT,"
    " file_extension TEXT,"
    " operation_type TEXT,"
    " git_branch TEXT,"
    " project TEXT,"
    " editor TEXT,"
    " platform TEXT,"
    " event_time TIMESTAMPTZ,"
    " absolute_filepath TEXT,"
    " event_type TEXT,"
    " language TEXT,"
    " recorded_at TIMESTAMPTZ NOT NULL DEFAULT now())";

const char PgSink::kInsertSql[] =
    "INSERT INTO codetime_entries ("
    "row_hash, entry_time, method, path, query, request_headers, request_body,"
    " response_status, response_headers, response_body, duration_ms,"
    " auth_header, client_ip, user_agent, windows_username, file_extension,"
    " operation_type, git_branch, project, editor, platform, event_time,"
    " absolute_filepath, event_type, language"
    ") VALUES ("
    "$1, $2::timestamptz, $3, $4, $5::jsonb, $6::jsonb, $7,"
    " $8::integer, $9::jsonb, $10, $11::double precision,"
    " $12, $13, $14, $15, $16,"
    " $17, $18, $19, $20, $21, $22::timestamptz,"
    " $23, $24, $25"
    ") ON CONFLICT (row_hash) DO NOTHING";

namespace {

std::optional<std::string> TextParam(const std::optional<std::string>& v) {
    if (!v) return std::nullopt;
    return EntryBuilder::CleanUtf8(*v);
}

} // namespace

PgConnectionPool::Params PgSink::InsertParams(const Entry& entry) {
    const RequestMetadata& m = entry.metadata;
    char duration[64];
    std::snprintf(duration, sizeof duration, "%.3f", entry.durationMs);

    PgConnectionPool::Params p;
    p.reserve(25);
    p.emplace_back(entry.rowHash);
    p.emplace_back(entry.timestamp);
    p.emplace_back(entry.method);
    p.emplace_back(entry.path);
    p.emplace_back(DumpJson(nlohmann::json(entry.query)));
    p.emplace_back(DumpJson(nlohmann::json(entry.requestHeaders)));
    p.emplace_back(entry.requestBody);
    p.emplace_back(std::to_string(entry.responseStatus));
    p.emplace_back(DumpJson(nlohmann::json(entry.responseHeaders)));
    p.emplace_back(entry.responseBody);
    p.emplace_back(std::string(duration));
    p.push_back(TextParam(m.authHeader));
    p.push_back(TextParam(m.clientIp));
    p.push_back(TextParam(m.userAgent));
    p.push_back(TextParam(m.windowsUsername));
    p.push_back(TextParam(m.fileExtension));
    p.push_back(TextParam(m.operationType));
    p.push_back(TextParam(m.gitBranch));
    p.push_back(TextParam(m.project));
    p.push_back(TextParam(m.editor));
    p.push_back(TextParam(m.platform));
    p.push_back(m.eventTime);
    p.push_back(TextParam(m.absoluteFilepath));
    p.push_back(TextParam(m.eventType));
    p.push_back(TextParam(m.language));
    return p;
}

PgSink::PgSink(const Options& opts)
    : thread_(new codetap::network::EventLoopThread("pg-sink")) {
    loop_ = thread_->StartLoop();

    PgConnectionPool::Options poolOpts;
    poolOpts.conninfo = opts.url;
    poolOpts.minConnections = opts.poolMin;
    poolOpts.maxConnections = opts.poolMax;
    pool_.reset(new PgConnectionPool(loop_, poolOpts));
    pool_->Start();

    if (opts.createSchema) {
        std::string error;
        if (ExecuteSync(kSchemaSql, {}, &error, 10000)) {
            LOG_INFO << "PgSink: schema ready";
        } else {
            LOG_ERROR << "PgSink: schema setup failed: " << error;
        }
    }
}

PgSink::~PgSink() {
    if (!Flush(5000)) {
        LOG_WARN << "PgSink: " << (submitted_ - completed_) << " inserts still pending at shutdown";
    }
    // the pool's channels belong to the sink loop; tear it down there
    std::promise<void> stopped;
    std::future<void> waited = stopped.get_future();
    loop_->RunInLoop([this, &stopped]() {
        pool_.reset();
        stopped.set_value();
    });
    waited.wait();
    thread_.reset();
}

void PgSink::Submit(const EntryPtr& entry) {
    PgConnectionPool::Params params;
    try {
        params = InsertParams(*entry);
    } catch (const std::exception& e) {
        ++failed_;
        LOG_ERROR << "PgSink: entry " << entry->rowHash << " not persisted: " << e.what();
        return;
    }
    ++submitted_;
    const std::string rowHash = entry->rowHash;
    pool_->Execute(kInsertSql, std::move(params), [this, rowHash](bool ok, const std::string& error) {
        if (!ok) {
            ++failed_;
            LOG_ERROR << "PgSink: entry " << rowHash << " not persisted: " << error;
        }
        ++completed_;
    });
}

bool PgSink::Flush(int timeoutMs) {
    const std::uint64_t target = submitted_;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (completed_ < target) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

bool PgSink::ExecuteSync(const std::string& sql, const PgConnectionPool::Params& params,
                         std::string* error, int timeoutMs) {
    auto done = std::make_shared<std::promise<std::pair<bool, std::string>>>();
    std::future<std::pair<bool, std::string>> result = done->get_future();
    pool_->Execute(sql, params, [done](bool ok, const std::string& err) {
        done->set_value(std::make_pair(ok, err));
    });
    if (result.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
        if (error) *error = "timed out";
        return false;
    }
    const std::pair<bool, std::string> r = result.get();
    if (error) *error = r.second;
    return r.first;
}

} // namespace audit
} // namespace codetap
