#include "codetap/audit/EntryBuilder.h"
#include "codetap/protocol/HttpRequest.h"
#include "codetap/common/Logger.h"

#include <cassert>
#include <string>

using namespace codetap::audit;
using namespace codetap::common;
using codetap::protocol::HttpClient;
using codetap::protocol::HttpRequest;

static HttpRequest makeRequest(HttpRequest::Method method, const std::string& path,
                               const std::string& query, const std::string& body) {
    HttpRequest req;
    req.setMethod(method);
    req.setPath(path);
    req.setQuery(query);
    req.setBody(body);
    req.addHeader("User-Agent", "CodeTime Client");
    return req;
}

static Forwarder::Outcome makeOutcome(int status, const std::string& body, double ms) {
    Forwarder::Outcome out;
    out.status = status;
    out.body = body;
    out.durationMs = ms;
    return out;
}

void testKnownRowHash() {
    // sha256 of {"method":"GET","path":"/v3/users/self/minutes","query":{},"request_body":"","response_status":200}
    const std::string h = EntryBuilder::RowHash("GET", "/v3/users/self/minutes", StringMap{}, "", 200);
    assert(h == "d516bc30526b4c6f5cb02b3a3a30817fd57e809a8bc095139e65d738727caebc");
    assert(h.size() == 64);
    LOG_INFO << "Known row hash PASS";
}

void testRowHashIgnoresVolatileFields() {
    HttpRequest a = makeRequest(HttpRequest::kPost, "/v3/users/event-log", "b=2&a=1", "{\"x\":1}");
    HttpRequest b = makeRequest(HttpRequest::kPost, "/v3/users/event-log", "a=1&b=2", "{\"x\":1}");
    b.addHeader("Authorization", "Bearer other");

    Forwarder::Outcome oa = makeOutcome(200, "{}", 12.5);
    oa.headers.emplace_back("date", "Mon");
    Forwarder::Outcome ob = makeOutcome(200, "{\"different\":true}", 99.0);

    RequestMetadata meta;
    meta.editor = std::string("vscode");

    EntryPtr ea = EntryBuilder::Build(a, oa, meta, "{}");
    EntryPtr eb = EntryBuilder::Build(b, ob, RequestMetadata(), "{\"different\":true}");
    assert(ea->rowHash == eb->rowHash);

    HttpRequest c = makeRequest(HttpRequest::kPost, "/v3/users/event-log", "a=1&b=2", "{\"x\":2}");
    assert(EntryBuilder::Build(c, oa, meta, "{}")->rowHash != ea->rowHash);
    assert(EntryBuilder::Build(a, makeOutcome(502, "", 1), meta, "{}")->rowHash != ea->rowHash);
    HttpRequest d = makeRequest(HttpRequest::kPut, "/v3/users/event-log", "a=1&b=2", "{\"x\":1}");
    assert(EntryBuilder::Build(d, oa, meta, "{}")->rowHash != ea->rowHash);
    LOG_INFO << "Row hash dedup law PASS";
}

void testBuildFields() {
    HttpRequest req = makeRequest(HttpRequest::kGet, "/v3/users/self/minutes%20x", "minutes=60&minutes=30&q=a+b%21", "");
    req.addHeader("Accept", "a");
    req.addHeader("accept", "b");
    Forwarder::Outcome out = makeOutcome(200, "{}", 3.25);
    out.headers.emplace_back("set-cookie", "a=1");
    out.headers.emplace_back("set-cookie", "b=2");
    out.headers.emplace_back("content-type", "application/json");

    EntryPtr e = EntryBuilder::Build(req, out, RequestMetadata(), "{}");
    assert(e->method == "GET");
    assert(e->path == "/v3/users/self/minutes x");
    assert(e->query.size() == 2);
    assert(e->query.at("minutes") == "30");
    assert(e->query.at("q") == "a b!");
    assert(e->requestHeaders.at("accept") == "a, b");
    assert(e->requestHeaders.at("user-agent") == "CodeTime Client");
    assert(e->responseHeaders.at("set-cookie") == "a=1, b=2");
    assert(e->responseStatus == 200);
    assert(e->responseBody == "{}");
    assert(e->durationMs == 3.25);
    // YYYY-MM-DDTHH:MM:SS.mmmZ
    assert(e->timestamp.size() == 24);
    assert(e->timestamp[10] == 'T' && e->timestamp[19] == '.' && e->timestamp.back() == 'Z');
    LOG_INFO << "Build fields PASS";
}

void testUtf8Cleanup() {
    assert(EntryBuilder::CleanUtf8("plain") == "plain");
    assert(EntryBuilder::CleanUtf8(std::string("a\0b", 3)) == "ab");
    assert(EntryBuilder::CleanUtf8("caf\xc3\xa9") == "caf\xc3\xa9");
    assert(EntryBuilder::CleanUtf8("bad\xff\xfe!") == "bad!");
    assert(EntryBuilder::CleanUtf8("cut\xe2\x82") == "cut");
    assert(EntryBuilder::CleanUtf8("\xc0\xaf") == "");  // overlong '/'
    assert(EntryBuilder::CleanUtf8("\xed\xa0\x80x") == "x");  // surrogate
    assert(EntryBuilder::CleanUtf8("\xf0\x9f\x98\x80") == "\xf0\x9f\x98\x80");

    HttpRequest req = makeRequest(HttpRequest::kPost, "/e", "", std::string("{\"a\":\"\xff\"}\0", 10));
    EntryPtr e = EntryBuilder::Build(req, makeOutcome(200, "{}", 1), RequestMetadata(), "{}");
    assert(e->requestBody == "{\"a\":\"\"}");
    LOG_INFO << "UTF-8 cleanup PASS";
}

void testJsonShape() {
    HttpRequest req = makeRequest(HttpRequest::kGet, "/v3/users/self/minutes", "", "");
    RequestMetadata meta;
    meta.language = std::string("go");
    EntryPtr e = EntryBuilder::Build(req, makeOutcome(200, "{}", 1), meta, "{}");

    nlohmann::json j = ToJson(*e);
    const char* keys[] = {
        "timestamp", "method", "path", "query", "request_headers", "request_body",
        "response_status", "response_headers", "response_body", "duration_ms", "row_hash",
        "auth_header", "client_ip", "user_agent", "windows_username", "file_extension",
        "operation_type", "git_branch", "project", "editor", "platform", "event_time",
        "absolute_filepath", "event_type", "language"};
    assert(j.size() == sizeof(keys) / sizeof(keys[0]));
    for (const char* k : keys) {
        assert(j.contains(k));
    }
    assert(j["language"] == "go");
    assert(j["editor"].is_null());
    assert(j["query"].is_object() && j["query"].empty());

    const std::string line = DumpJson(j);
    assert(line.find('\n') == std::string::npos);
    assert(nlohmann::json::parse(line)["row_hash"] == e->rowHash);
    LOG_INFO << "JSON shape PASS";
}

void testFormatUtcMillis() {
    assert(*FormatUtcMillis(1700000000000LL) == "2023-11-14T22:13:20.000Z");
    assert(*FormatUtcMillis(253402300799999LL) == "9999-12-31T23:59:59.999Z");
    assert(!FormatUtcMillis(253402300800000LL));
    assert(!FormatUtcMillis(-1));
    LOG_INFO << "FormatUtcMillis PASS";
}

int main() {
    testKnownRowHash();
    testRowHashIgnoresVolatileFields();
    testBuildFields();
    testUtf8Cleanup();
    testJsonShape();
    testFormatUtcMillis();
    return 0;
}
