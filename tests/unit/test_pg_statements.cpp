#include "codetap/audit/Entry.h"
#include "codetap/audit/PgSink.h"
#include "codetap/common/Logger.h"

#include <cassert>
#include <cstring>
#include <memory>
#include <string>

using namespace codetap::audit;
using namespace codetap::common;

static bool endsWith(const std::string& s, const std::string& tail) {
    return s.size() >= tail.size() && s.compare(s.size() - tail.size(), tail.size(), tail) == 0;
}

void testInsertIsIdempotent() {
    const std::string sql = PgSink::kInsertSql;
    assert(endsWith(sql, "ON CONFLICT (row_hash) DO NOTHING"));

    const std::string schema = PgSink::kSchemaSql;
    assert(schema.find("row_hash TEXT UNIQUE") != std::string::npos);
    LOG_INFO << "Insert conflict clause PASS";
}

void testPlaceholdersMatchParams() {
    const std::string sql = PgSink::kInsertSql;
    assert(sql.find("$25") != std::string::npos);
    assert(sql.find("$26") == std::string::npos);

    // one column name per placeholder
    const size_t open = sql.find('(');
    const size_t close = sql.find(')', open);
    const std::string columns = sql.substr(open + 1, close - open - 1);
    size_t commas = 0;
    for (char c : columns) {
        if (c == ',') ++commas;
    }
    assert(commas + 1 == 25);
    LOG_INFO << "Placeholders PASS";
}

void testInsertParams() {
    Entry e;
    e.rowHash = "abc123";
    e.timestamp = "2024-01-02T03:04:05.678Z";
    e.method = "GET";
    e.path = "/v3/users/self/minutes";
    e.query["minutes"] = "60";
    e.responseStatus = 200;
    e.durationMs = 12.5;
    e.metadata.userAgent = std::string("CodeTime Client/2.3");
    e.metadata.language = std::string("rust");

    PgConnectionPool::Params p = PgSink::InsertParams(e);
    assert(p.size() == 25);
    assert(p[0] == std::string("abc123"));
    assert(p[1] == std::string("2024-01-02T03:04:05.678Z"));
    assert(p[4] == std::string("{\"minutes\":\"60\"}"));
    assert(p[7] == std::string("200"));
    assert(p[10] == std::string("12.500"));
    assert(p[11] == std::nullopt);
    assert(p[13] == std::string("CodeTime Client/2.3"));
    assert(p[21] == std::nullopt);
    assert(p[24] == std::string("rust"));
    LOG_INFO << "Insert params PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testInsertIsIdempotent();
    testPlaceholdersMatchParams();
    testInsertParams();
    return 0;
}
