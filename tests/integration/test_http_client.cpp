#include "codetap/protocol/Compression.h"
#include "codetap/protocol/HttpClient.h"
#include "codetap/protocol/UpstreamConnectionPool.h"
#include "codetap/protocol/UpstreamUrl.h"
#include "codetap/network/Buffer.h"
#include "codetap/network/EventLoop.h"
#include "codetap/network/EventLoopThread.h"
#include "codetap/network/InetAddress.h"
#include "codetap/network/TcpConnection.h"
#include "codetap/network/TcpServer.h"
#include "codetap/common/Logger.h"
#include "GzipBody.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <future>
#include <memory>
#include <string>

using namespace codetap::protocol;
using namespace codetap::network;
using namespace codetap::common;

static std::atomic<int> g_connects{0};
static std::atomic<int> g_drops{0};

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string raw200(const std::string& body, const std::string& extra = "") {
    return "HTTP/1.1 200 OK\r\n" + extra + "Content-Length: " + std::to_string(body.size()) +
           "\r\n\r\n" + body;
}

// Canned upstream: answers by request path with hand-written bytes.
static void respond(const TcpConnectionPtr& conn, const std::string& request) {
    const size_t sp1 = request.find(' ');
    const size_t sp2 = request.find(' ', sp1 + 1);
    const std::string target = request.substr(sp1 + 1, sp2 - sp1 - 1);

    if (target == "/plain") {
        conn->Send(raw200("hello", "Content-Type: text/plain\r\n"));
    } else if (target.rfind("/echo", 0) == 0) {
        conn->Send(raw200(request));
    } else if (target == "/chunked") {
        conn->Send("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                   "3\r\nabc\r\n3\r\ndef\r\n0\r\n\r\n");
    } else if (target == "/gzip") {
        std::string packed;
        assert(codetap::testing::GzipBody(std::string("{\"minutes\":42}"), &packed));
        conn->Send(raw200(packed, "Content-Encoding: gzip\r\n"));
    } else if (target == "/brotli") {
        conn->Send(raw200("xx", "Content-Encoding: br\r\n"));
    } else if (target == "/teapot") {
        conn->Send("HTTP/1.1 418 I'm a teapot\r\nContent-Length: 0\r\n\r\n");
    } else if (target == "/close-after") {
        conn->Send(raw200("ok", "Connection: close\r\n"));
        conn->Shutdown();
    } else if (target == "/garbage") {
        conn->Send("SPDY nonsense\r\n\r\n");
        conn->Shutdown();
    } else if (target == "/early-close") {
        conn->Send("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nabc");
        conn->Shutdown();
    } else if (target == "/drop") {
        // read the request, then hang up without an answer
        ++g_drops;
        conn->Shutdown();
    } else if (target == "/slow") {
        // never answered
    } else {
        conn->Send("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
    }
}

static void onUpstreamMessage(const TcpConnectionPtr& conn, Buffer* buf,
                              std::chrono::system_clock::time_point) {
    while (true) {
        const std::string data(buf->Peek(), buf->ReadableBytes());
        const size_t end = data.find("\r\n\r\n");
        if (end == std::string::npos) return;
        size_t bodyLen = 0;
        const std::string head = toLower(data.substr(0, end));
        const size_t cl = head.find("content-length:");
        if (cl != std::string::npos) {
            bodyLen = std::strtoul(head.c_str() + cl + 15, nullptr, 10);
        }
        if (data.size() < end + 4 + bodyLen) return;
        const std::string request = buf->RetrieveAsString(end + 4 + bodyLen);
        respond(conn, request);
    }
}

template <typename F>
static void runOn(EventLoop* loop, F f) {
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> fut = done->get_future();
    loop->RunInLoop([done, f]() mutable {
        f();
        done->set_value();
    });
    fut.wait();
}

static uint16_t unusedPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    ::close(fd);
    return ntohs(addr.sin_port);
}

static HttpClient::Result call(EventLoop* loop, HttpClient* client,
                               const std::string& method,
                               const std::string& target,
                               const std::string& body = "",
                               HttpClient::HeaderList headers = {}) {
    auto done = std::make_shared<std::promise<HttpClient::Result>>();
    std::future<HttpClient::Result> fut = done->get_future();
    loop->RunInLoop([=]() {
        HttpClient::Request req;
        req.method = method;
        req.target = target;
        req.headers = headers;
        req.body = body;
        client->Send(loop, std::move(req), [done](const HttpClient::Result& r) { done->set_value(r); });
    });
    assert(fut.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    return fut.get();
}

static std::string header(const HttpClient::Result& r, const std::string& name) {
    for (const auto& h : r.headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

static void testKeepAliveReuse(EventLoop* loop, HttpClient* client, UpstreamConnectionPool* pool) {
    const int before = g_connects.load();
    HttpClient::Result r1 = call(loop, client, "GET", "/plain");
    assert(r1.outcome == HttpClient::kOk);
    assert(r1.status == 200);
    assert(r1.reason == "OK");
    assert(r1.body == "hello");
    assert(header(r1, "content-type") == "text/plain");
    assert(pool->IdleCount(loop) == 1);

    HttpClient::Result r2 = call(loop, client, "GET", "/plain");
    assert(r2.outcome == HttpClient::kOk);
    assert(r2.body == "hello");
    assert(g_connects.load() == before + 1);
    assert(pool->IdleCount(loop) == 1);
    LOG_INFO << "Keep-alive reuse PASS";
}

static void testRequestFraming(EventLoop* loop, HttpClient* client) {
    HttpClient::Result r = call(loop, client, "POST", "/echo?a=1", "ping",
                                {{"Host", "example.test"}, {"X-Trace", "7"}});
    assert(r.outcome == HttpClient::kOk);
    assert(r.body.rfind("POST /echo?a=1 HTTP/1.1\r\n", 0) == 0);
    assert(r.body.find("Host: example.test\r\n") != std::string::npos);
    assert(r.body.find("X-Trace: 7\r\n") != std::string::npos);
    assert(r.body.find("Content-Length: 4\r\n") != std::string::npos);
    assert(r.body.find("Connection: keep-alive\r\n") != std::string::npos);
    assert(r.body.size() >= 4 && r.body.compare(r.body.size() - 4, 4, "ping") == 0);

    HttpClient::Result g = call(loop, client, "GET", "/echo");
    assert(g.outcome == HttpClient::kOk);
    assert(g.body.find("Content-Length") == std::string::npos);

    HttpClient::Result empty = call(loop, client, "PUT", "/echo");
    assert(empty.outcome == HttpClient::kOk);
    assert(empty.body.find("Content-Length: 0\r\n") != std::string::npos);
    LOG_INFO << "Request framing PASS";
}

static void testDecoding(EventLoop* loop, HttpClient* client) {
    HttpClient::Result chunked = call(loop, client, "GET", "/chunked");
    assert(chunked.outcome == HttpClient::kOk);
    assert(chunked.body == "abcdef");

    HttpClient::Result gz = call(loop, client, "GET", "/gzip");
    assert(gz.outcome == HttpClient::kOk);
    assert(gz.body == "{\"minutes\":42}");
    assert(header(gz, "content-encoding") == "gzip");

    HttpClient::Result teapot = call(loop, client, "GET", "/teapot");
    assert(teapot.outcome == HttpClient::kOk);
    assert(teapot.status == 418);
    assert(teapot.body.empty());
    LOG_INFO << "Body decoding PASS";
}

static void testConnectionClose(EventLoop* loop, HttpClient* client, UpstreamConnectionPool* pool) {
    runOn(loop, [pool]() { pool->Clear(); });
    HttpClient::Result r = call(loop, client, "GET", "/close-after");
    assert(r.outcome == HttpClient::kOk);
    assert(r.body == "ok");
    assert(pool->IdleCount(loop) == 0);
    LOG_INFO << "Connection: close not pooled PASS";
}

static void testProtocolErrors(EventLoop* loop, HttpClient* client) {
    HttpClient::Result br = call(loop, client, "GET", "/brotli");
    assert(br.outcome == HttpClient::kProtocolError);
    assert(br.error.find("br") != std::string::npos);

    HttpClient::Result garbage = call(loop, client, "GET", "/garbage");
    assert(garbage.outcome == HttpClient::kProtocolError);

    HttpClient::Result early = call(loop, client, "GET", "/early-close");
    assert(early.outcome == HttpClient::kProtocolError);

    // the client recovers on a fresh connection
    HttpClient::Result ok = call(loop, client, "GET", "/plain");
    assert(ok.outcome == HttpClient::kOk);
    LOG_INFO << "Protocol errors PASS";
}

// A pooled connection that dies after taking the request: only idempotent
// methods go out a second time.
static void testDroppedPooledConnection(EventLoop* loop, HttpClient* client, UpstreamConnectionPool* pool) {
    runOn(loop, [pool]() { pool->Clear(); });
    assert(call(loop, client, "GET", "/plain").outcome == HttpClient::kOk);
    assert(pool->IdleCount(loop) == 1);

    const int before = g_drops.load();
    HttpClient::Result post = call(loop, client, "POST", "/drop", "{\"n\":1}");
    assert(post.outcome == HttpClient::kProtocolError);
    assert(post.error == "upstream closed the connection");
    assert(g_drops.load() == before + 1);

    assert(call(loop, client, "GET", "/plain").outcome == HttpClient::kOk);
    assert(pool->IdleCount(loop) == 1);
    HttpClient::Result get = call(loop, client, "GET", "/drop");
    assert(get.outcome == HttpClient::kProtocolError);
    assert(g_drops.load() == before + 3);
    LOG_INFO << "Dropped pooled connection PASS";
}

static void testTimeout(EventLoop* loop, HttpClient* client) {
    HttpClient::Result r = call(loop, client, "GET", "/slow");
    assert(r.outcome == HttpClient::kTimeout);
    assert(r.status == 0);
    assert(r.durationMs >= 250.0);
    assert(std::string(HttpClient::OutcomeName(r.outcome)) == "timeout");
    LOG_INFO << "Timeout PASS";
}

static void testConnectFailed(EventLoop* loop) {
    UpstreamConnectionPool pool;
    auto url = UpstreamUrl::Parse("http://127.0.0.1:" + std::to_string(unusedPort()));
    assert(url);
    HttpClient client(*url, nullptr, &pool, 2000);
    HttpClient::Result r = call(loop, &client, "GET", "/plain");
    assert(r.outcome == HttpClient::kConnectFailed);
    assert(!r.error.empty());
    assert(std::string(HttpClient::OutcomeName(r.outcome)) == "connect-failed");
    runOn(loop, [&pool]() { pool.Clear(); });
    LOG_INFO << "Connect failure PASS";
}

static void testResolveByName(EventLoop* loop, uint16_t port) {
    UpstreamConnectionPool pool;
    auto url = UpstreamUrl::Parse("http://localhost:" + std::to_string(port));
    assert(url);
    HttpClient client(*url, nullptr, &pool, 2000);
    HttpClient::Result first = call(loop, &client, "GET", "/plain");
    assert(first.outcome == HttpClient::kOk);
    assert(first.body == "hello");
    // served from the cached address
    HttpClient::Result second = call(loop, &client, "GET", "/plain");
    assert(second.outcome == HttpClient::kOk);
    runOn(loop, [&pool]() { pool.Clear(); });

    // the lookup runs on the resolver thread; the caller's loop stays free
    UpstreamConnectionPool pool2;
    auto bad = UpstreamUrl::Parse("http://codetap-upstream.invalid:8080");
    assert(bad);
    HttpClient unresolvable(*bad, nullptr, &pool2, 2000);
    auto done = std::make_shared<std::promise<HttpClient::Result>>();
    std::future<HttpClient::Result> fut = done->get_future();
    loop->RunInLoop([&unresolvable, loop, done]() {
        HttpClient::Request req;
        req.method = "GET";
        req.target = "/plain";
        unresolvable.Send(loop, std::move(req), [done](const HttpClient::Result& r) { done->set_value(r); });
    });
    const auto start = std::chrono::steady_clock::now();
    runOn(loop, []() {});
    assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(500));
    assert(fut.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    HttpClient::Result r = fut.get();
    assert(r.outcome == HttpClient::kConnectFailed || r.outcome == HttpClient::kTimeout);
    LOG_INFO << "Resolve by name PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);

    EventLoopThread upstreamThread("upstream");
    EventLoop* upstreamLoop = upstreamThread.StartLoop();
    std::unique_ptr<TcpServer> upstream;
    uint16_t port = 0;
    runOn(upstreamLoop, [&]() {
        upstream.reset(new TcpServer(upstreamLoop, InetAddress(0, true), "fake-upstream"));
        upstream->SetConnectionCallback([](const TcpConnectionPtr& c) {
            if (c->connected()) ++g_connects;
        });
        upstream->SetMessageCallback(onUpstreamMessage);
        upstream->Start();
        port = upstream->listenAddress().toPort();
    });
    assert(port != 0);

    EventLoopThread clientThread("client");
    EventLoop* clientLoop = clientThread.StartLoop();

    {
        UpstreamConnectionPool pool;
        auto url = UpstreamUrl::Parse("http://127.0.0.1:" + std::to_string(port));
        assert(url);
        HttpClient client(*url, nullptr, &pool, 400);

        testKeepAliveReuse(clientLoop, &client, &pool);
        testRequestFraming(clientLoop, &client);
        testDecoding(clientLoop, &client);
        testConnectionClose(clientLoop, &client, &pool);
        testProtocolErrors(clientLoop, &client);
        testDroppedPooledConnection(clientLoop, &client, &pool);
        testTimeout(clientLoop, &client);
        testConnectFailed(clientLoop);
        testResolveByName(clientLoop, port);

        runOn(clientLoop, [&pool]() { pool.Clear(); });
    }
    runOn(upstreamLoop, [&upstream]() { upstream.reset(); });

    LOG_INFO << "All HttpClient tests PASS";
    return 0;
}
