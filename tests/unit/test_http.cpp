#include "codetap/protocol/Compression.h"
#include "codetap/protocol/HttpContext.h"
#include "codetap/protocol/HttpResponse.h"
#include "codetap/protocol/HttpResponseContext.h"
#include "codetap/protocol/UpstreamUrl.h"
#include "codetap/network/Buffer.h"
#include "codetap/common/Logger.h"
#include "GzipBody.h"

#include <cassert>
#include <string>

using namespace codetap::protocol;
using namespace codetap::network;
using namespace codetap::common;

static bool parseAll(HttpContext* context, const std::string& input) {
    Buffer buf;
    buf.Append(input);
    return context->parseRequest(&buf, std::chrono::system_clock::now());
}

void testParseRequest() {
    HttpContext context;
    Buffer buf;

    buf.Append("GET /index.html?id=123&x=%41 HTTP/1.1\r\nHost: ");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(!context.gotAll());

    buf.Append("localhost\r\nUser-Agent: curl/7.68.0\r\nAccept: */*\r\nAccept: text/html\r\n\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());

    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kGet);
    assert(req.getVersion() == HttpRequest::kHttp11);
    assert(req.path() == "/index.html");
    assert(req.query() == "id=123&x=%41");
    assert(req.getHeader("Host") == "localhost");
    assert(req.getHeader("user-agent") == "curl/7.68.0");
    assert(req.getHeader("ACCEPT") == "*/*, text/html");
    assert(req.headers().count("user-agent") == 1);
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Parse Request PASS";
}

void testParseBodies() {
    HttpContext context;
    assert(parseAll(&context, "POST /submit HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello"));
    assert(context.gotAll());
    assert(context.request().body() == "hello");

    context.reset();
    assert(parseAll(&context,
                    "POST /chunk HTTP/1.1\r\nTransfer-Encoding: chunked\r\nContent-Length: 99\r\n\r\n"
                    "5\r\nhello\r\n6;ext=1\r\n world\r\n0\r\nX-Trailer: 1\r\n\r\n"));
    assert(context.gotAll());
    assert(context.request().body() == "hello world");

    // chunked body fed one byte at a time
    context.reset();
    const std::string input =
        "PATCH /slow HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n0\r\n\r\n";
    Buffer buf;
    for (char c : input) {
        buf.Append(&c, 1);
        assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    assert(context.gotAll());
    assert(context.request().getMethod() == HttpRequest::kPatch);
    assert(context.request().body() == "abc");
    LOG_INFO << "Parse bodies PASS";
}

void testAbsoluteFormAndHttp10() {
    HttpContext context;
    assert(parseAll(&context, "GET http://api.example.com:80/v3/users?a=1 HTTP/1.0\r\n\r\n"));
    assert(context.gotAll());
    assert(context.request().path() == "/v3/users");
    assert(context.request().query() == "a=1");
    assert(context.request().getVersion() == HttpRequest::kHttp10);

    context.reset();
    assert(parseAll(&context, "OPTIONS http://api.example.com HTTP/1.1\r\n\r\n"));
    assert(context.request().path() == "/");
    LOG_INFO << "Absolute form PASS";
}

void testMalformedRequests() {
    HttpContext a;
    assert(!parseAll(&a, "BREW /pot HTTP/1.1\r\n\r\n"));
    HttpContext b;
    assert(!parseAll(&b, "GET / HTTP/2.0\r\n\r\n"));
    HttpContext c;
    assert(!parseAll(&c, "POST / HTTP/1.1\r\nContent-Length: 5x\r\n\r\nhello"));
    HttpContext d;
    assert(!parseAll(&d, "GET / HTTP/1.1\r\nno colon here\r\n\r\n"));
    HttpContext e;
    assert(!parseAll(&e, "POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"));
    HttpContext f;
    assert(!parseAll(&f, "GET /" + std::string(HttpContext::kMaxHeaderBytes + 10, 'a')));
    LOG_INFO << "Malformed requests PASS";
}

void testOversizedBodies() {
    HttpContext declared(10);
    Buffer buf;
    buf.Append("POST /big HTTP/1.1\r\nContent-Length: 11\r\n\r\nhello");
    assert(declared.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(declared.gotAll());
    assert(declared.request().bodyTooLarge());

    HttpContext chunked(10);
    assert(parseAll(&chunked, "POST /big HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n8\r\n12345678\r\n8\r\n12345678\r\n"));
    assert(chunked.gotAll());
    assert(chunked.request().bodyTooLarge());

    HttpContext fits(10);
    assert(parseAll(&fits, "POST /ok HTTP/1.1\r\nContent-Length: 10\r\n\r\n0123456789"));
    assert(fits.gotAll() && !fits.request().bodyTooLarge());
    LOG_INFO << "Oversized bodies PASS";
}

void testResponseGen() {
    HttpResponse resp(true);
    resp.setStatusCode(HttpResponse::k403Forbidden);
    resp.setContentType("text/plain");
    resp.setBody("Unsupported client");

    Buffer buf;
    resp.appendToBuffer(&buf);
    const std::string expected =
        "HTTP/1.1 403 Forbidden\r\n"
        "Content-Length: 18\r\n"
        "Connection: close\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "Unsupported client";
    assert(buf.RetrieveAllAsString() == expected);

    HttpResponse head(false);
    head.setStatusCode(200);
    head.setBody("abc");
    head.setSuppressBody(true);
    head.appendToBuffer(&buf);
    const std::string out = buf.RetrieveAllAsString();
    assert(out.find("Content-Length: 3\r\n") != std::string::npos);
    assert(out.find("Connection: keep-alive\r\n") != std::string::npos);
    assert(out.size() >= 4 && out.compare(out.size() - 4, 4, "\r\n\r\n") == 0);

    assert(std::string(HttpResponse::ReasonPhrase(504)) == "Gateway Timeout");
    assert(std::string(HttpResponse::ReasonPhrase(418)) == "Unknown");
    LOG_INFO << "Response Gen PASS";
}

void testResponseParser() {
    HttpResponseContext ctx;
    const std::string two =
        "HTTP/1.1 100 Continue\r\n\r\n"
        "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nSet-Cookie: a=1\r\nSet-Cookie: b=2\r\n\r\n{}"
        "HTTP/1.1 204 No Content\r\n\r\n";
    size_t used = 0;
    assert(ctx.feed(two.data(), two.size(), &used));
    assert(ctx.statusCode() == 200);
    assert(ctx.reason() == "OK");
    assert(ctx.body() == "{}");
    assert(ctx.keepAlive());
    assert(ctx.getHeader("set-cookie") == "a=1, b=2");
    assert(ctx.headerMap().at("content-length") == "2");
    assert(ctx.headers().size() == 3);
    assert(two.compare(used, std::string::npos, "HTTP/1.1 204 No Content\r\n\r\n") == 0);

    ctx.reset();
    assert(ctx.feed(two.data() + used, two.size() - used));
    assert(ctx.statusCode() == 204 && ctx.body().empty());

    ctx.reset();
    const std::string chunked =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n4\r\nabcd\r\n0\r\n\r\n";
    for (size_t i = 0; i < chunked.size(); ++i) {
        const bool done = ctx.feed(chunked.data() + i, 1);
        assert(done == (i + 1 == chunked.size()));
    }
    assert(ctx.body() == "abcd");
    assert(!ctx.keepAlive());

    ctx.reset();
    const std::string untilClose = "HTTP/1.0 200 OK\r\n\r\npartial";
    assert(!ctx.feed(untilClose.data(), untilClose.size()));
    assert(ctx.needsCloseToFinish());
    assert(ctx.onClose());
    assert(ctx.body() == "partial");
    assert(!ctx.keepAlive());

    ctx.reset();
    const std::string truncated = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc";
    assert(!ctx.feed(truncated.data(), truncated.size()));
    assert(!ctx.onClose());
    assert(ctx.hasError());

    ctx.reset();
    ctx.setExpectNoBody(true);
    const std::string head = "HTTP/1.1 200 OK\r\nContent-Length: 1234\r\n\r\n";
    assert(ctx.feed(head.data(), head.size()));
    assert(ctx.body().empty());

    ctx.reset();
    const std::string garbage = "SSH-2.0-OpenSSH\r\n\r\n";
    assert(!ctx.feed(garbage.data(), garbage.size()));
    assert(ctx.hasError());

    HttpResponseContext limited;
    limited.setMaxBodyBytes(4);
    const std::string big = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello";
    assert(!limited.feed(big.data(), big.size()));
    assert(limited.hasError());
    LOG_INFO << "Response parser PASS";
}

void testCompression() {
    assert(Compression::ParseContentEncoding("") == Compression::Encoding::kIdentity);
    assert(Compression::ParseContentEncoding("GZIP") == Compression::Encoding::kGzip);
    assert(Compression::ParseContentEncoding("deflate") == Compression::Encoding::kDeflate);
    assert(Compression::ParseContentEncoding("br") == Compression::Encoding::kUnknown);

    const std::string payload = std::string(4096, 'z') + "{\"minutes\":42}";
    std::string packed;
    std::string unpacked;
    assert(codetap::testing::GzipBody(payload, &packed));
    assert(packed.size() < payload.size());
    assert(Compression::Decompress(Compression::Encoding::kGzip, packed, &unpacked));
    assert(unpacked == payload);

    assert(!Compression::Decompress(Compression::Encoding::kGzip, "not gzip at all", &unpacked));
    assert(!Compression::Decompress(Compression::Encoding::kDeflate, "\x01\x02\x03", &unpacked));
    LOG_INFO << "Compression PASS";
}

void testUpstreamUrl() {
    std::optional<UpstreamUrl> u = UpstreamUrl::Parse("https://api.codetime.dev");
    assert(u && u->tls() && u->port == 443);
    assert(u->authority() == "api.codetime.dev");
    assert(u->TargetUrl("/v3/users/event-log") == "https://api.codetime.dev/v3/users/event-log");
    assert(u->TargetUrl("v3/users/event-log") == "https://api.codetime.dev/v3/users/event-log");
    assert(u->TargetUrl("") == "https://api.codetime.dev/");
    assert(u->TargetUrl("/") == "https://api.codetime.dev/");
    assert(u->TargetUrl("/v3/x", "a=1&b=%20") == "https://api.codetime.dev/v3/x?a=1&b=%20");

    u = UpstreamUrl::Parse("http://127.0.0.1:8080/");
    assert(u && !u->tls() && u->port == 8080);
    assert(u->authority() == "127.0.0.1:8080");
    assert(u->ToString() == "http://127.0.0.1:8080");

    u = UpstreamUrl::Parse("HTTP://example.com:80/api/");
    assert(u && u->authority() == "example.com" && u->basePath == "/api");
    assert(u->TargetPath("/v1") == "/api/v1");
    assert(u->TargetPath("") == "/api/");

    assert(!UpstreamUrl::Parse(""));
    assert(!UpstreamUrl::Parse("api.codetime.dev"));
    assert(!UpstreamUrl::Parse("ftp://example.com"));
    assert(!UpstreamUrl::Parse("https://"));
    assert(!UpstreamUrl::Parse("https://user:pw@example.com"));
    assert(!UpstreamUrl::Parse("https://example.com:0"));
    assert(!UpstreamUrl::Parse("https://example.com:99999"));
    assert(!UpstreamUrl::Parse("https://exa mple.com"));
    assert(!UpstreamUrl::Parse("https://example.com/a?b=c"));
    LOG_INFO << "Upstream URL PASS";
}

int main() {
    testParseRequest();
    testParseBodies();
    testAbsoluteFormAndHttp10();
    testMalformedRequests();
    testOversizedBodies();
    testResponseGen();
    testResponseParser();
    testCompression();
    testUpstreamUrl();
    return 0;
}
