#include "codetap/audit/Entry.h"
#include "codetap/audit/EntryBuilder.h"
#include "codetap/audit/PgSink.h"
#include "codetap/common/Logger.h"

#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

using namespace codetap::audit;
using namespace codetap::common;

static EntryPtr makeEntry(const std::string& tag, const std::string& timestamp) {
    auto e = std::make_shared<Entry>();
    e->timestamp = timestamp;
    e->method = "POST";
    e->path = "/v3/eventLog";
    e->query["tag"] = tag;
    e->requestHeaders["user-agent"] = "CodeTime Client/2.3";
    e->requestBody = "{\"project\":\"codetap\"}";
    e->responseStatus = 200;
    e->responseHeaders["content-type"] = "application/json";
    e->responseBody = "{}";
    e->durationMs = 3.25;
    e->rowHash = EntryBuilder::RowHash(e->method, e->path, e->query, e->requestBody, e->responseStatus);
    e->metadata.project = "codetap";
    e->metadata.eventTime = "2023-11-14T22:13:20.000Z";
    return e;
}

// No server behind the URL: inserts fail, are counted, and nothing blocks.
static void testUnreachableDatabase() {
    PgSink::Options opts;
    opts.url = "postgresql://codetap@127.0.0.1:1/codetap?connect_timeout=2";
    PgSink sink(opts);
    sink.Submit(makeEntry("unreachable", "2024-01-02T03:04:05.678Z"));
    assert(sink.Flush(10000));
    assert(sink.submitted() == 1);
    assert(sink.failed() == 1);
    LOG_INFO << "Unreachable database PASS";
}

static void testInsertAndDedup(const std::string& url) {
    PgSink::Options opts;
    opts.url = url;
    opts.createSchema = true;
    PgSink sink(opts);

    const std::string tag = "dedup-" + std::to_string(::getpid()) + "-" +
                            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    EntryPtr entry = makeEntry(tag, "2024-01-02T03:04:05.678Z");
    sink.Submit(entry);
    sink.Submit(entry);
    assert(sink.Flush(10000));
    assert(sink.completed() == 2);
    assert(sink.failed() == 0);

    // exactly one row survives the duplicate insert
    std::string error;
    const std::string check =
        "DO $$ BEGIN IF (SELECT count(*) FROM codetime_entries WHERE row_hash = '" + entry->rowHash +
        "') <> 1 THEN RAISE EXCEPTION 'row_hash not unique'; END IF; END $$";
    assert(sink.ExecuteSync(check, {}, &error, 10000));

    // a value the column cannot take fails that entry only
    sink.Submit(makeEntry(tag + "-bad", "not a timestamp"));
    assert(sink.Flush(10000));
    assert(sink.failed() == 1);

    assert(sink.ExecuteSync("DELETE FROM codetime_entries WHERE row_hash = $1",
                            {entry->rowHash}, &error, 10000));
    LOG_INFO << "Insert and dedup PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::FATAL);

    testUnreachableDatabase();

    const char* url = std::getenv("CODETAP_TEST_PG_URL");
    if (url == nullptr || *url == '\0') {
        Logger::Instance().SetLevel(LogLevel::INFO);
        LOG_INFO << "CODETAP_TEST_PG_URL not set, skipping database tests";
        return 0;
    }
    Logger::Instance().SetLevel(LogLevel::WARN);
    testInsertAndDedup(url);
    return 0;
}
