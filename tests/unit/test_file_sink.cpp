#include "codetap/audit/FileSink.h"
#include "codetap/audit/PersistenceFanout.h"
#include "codetap/common/Logger.h"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <sys/resource.h>
#include <unistd.h>

using namespace codetap::audit;
using namespace codetap::common;

static std::string tempDir(const char* tag) {
    return (std::filesystem::temp_directory_path() /
            (std::string("codetap_") + tag + "_" + std::to_string(::getpid())))
        .string();
}

static std::vector<std::string> readLines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

static EntryPtr makeEntry(int i) {
    auto e = std::make_shared<Entry>();
    e->timestamp = "2024-01-01T00:00:00.000Z";
    e->method = "POST";
    e->path = "/v3/users/event-log";
    e->requestBody = "{\"n\":" + std::to_string(i) + ",\"pad\":\"" + std::string(512, 'x') + "\"}";
    e->responseStatus = 200;
    e->responseBody = "{}";
    e->rowHash = "hash-" + std::to_string(i);
    e->metadata.language = std::string("go");
    return e;
}

void testLazyDirectoryAndFormat() {
    const std::string dir = tempDir("lazy") + "/nested/logs";
    std::filesystem::remove_all(tempDir("lazy"));
    {
        FileSink sink(dir);
        assert(!std::filesystem::exists(dir));
        sink.Submit(makeEntry(1));
        sink.Flush();
        assert(std::filesystem::exists(sink.path()));
        assert(sink.path() == dir + "/traffic.jsonl");
    }
    std::vector<std::string> lines = readLines(dir + "/traffic.jsonl");
    assert(lines.size() == 1);
    nlohmann::json j = nlohmann::json::parse(lines[0]);
    assert(j["row_hash"] == "hash-1");
    assert(j["language"] == "go");
    assert(j["editor"].is_null());
    std::filesystem::remove_all(tempDir("lazy"));
    LOG_INFO << "Lazy directory and format PASS";
}

void testConcurrentAppendsNeverInterleave() {
    const std::string dir = tempDir("concurrent");
    std::filesystem::remove_all(dir);
    const int kThreads = 8;
    const int kPerThread = 200;
    {
        FileSink sink(dir);
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&sink, t]() {
                for (int i = 0; i < kPerThread; ++i) {
                    sink.Submit(makeEntry(t * kPerThread + i));
                }
            });
        }
        // direct appends race the sink loop for the same lock
        std::thread direct([&sink]() {
            for (int i = 0; i < kPerThread; ++i) {
                assert(sink.AppendLine(DumpJson(ToJson(*makeEntry(100000 + i)))));
            }
        });
        for (auto& th : threads) th.join();
        direct.join();
        sink.Flush();
    }

    std::vector<std::string> lines = readLines(dir + "/traffic.jsonl");
    assert(lines.size() == static_cast<size_t>(kThreads * kPerThread + kPerThread));
    std::set<std::string> hashes;
    for (const auto& line : lines) {
        nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
        assert(!j.is_discarded());
        assert(j.is_object() && j.size() == 25);
        hashes.insert(j["row_hash"].get<std::string>());
    }
    assert(hashes.size() == lines.size());
    std::filesystem::remove_all(dir);
    LOG_INFO << "Concurrent appends PASS";
}

void testUnwritableDirectoryIsReported() {
    const std::string blocker = tempDir("blocker");
    std::filesystem::remove_all(blocker);
    { std::ofstream f(blocker); f << "not a directory"; }
    {
        FileSink sink(blocker + "/logs");
        sink.Submit(makeEntry(1));
        sink.Flush();
        assert(!sink.AppendLine("{}"));
    }
    std::filesystem::remove_all(blocker);
    LOG_INFO << "Unwritable directory PASS";
}

// A write cut short by the file size limit leaves no fragment behind.
void testPartialWriteIsRolledBack() {
    const std::string dir = tempDir("partial");
    std::filesystem::remove_all(dir);
    const std::string first = DumpJson(ToJson(*makeEntry(1)));
    {
        FileSink sink(dir);
        assert(sink.AppendLine(first));
        const auto intact = std::filesystem::file_size(sink.path());
        assert(intact == first.size() + 1);

        struct rlimit saved;
        assert(::getrlimit(RLIMIT_FSIZE, &saved) == 0);
        ::signal(SIGXFSZ, SIG_IGN);
        struct rlimit tight = saved;
        tight.rlim_cur = intact + 100;
        assert(::setrlimit(RLIMIT_FSIZE, &tight) == 0);
        assert(!sink.AppendLine(DumpJson(ToJson(*makeEntry(2)))));
        assert(::setrlimit(RLIMIT_FSIZE, &saved) == 0);
        ::signal(SIGXFSZ, SIG_DFL);

        assert(std::filesystem::file_size(sink.path()) == intact);
        assert(sink.AppendLine(DumpJson(ToJson(*makeEntry(3)))));
    }
    std::vector<std::string> lines = readLines(dir + "/traffic.jsonl");
    assert(lines.size() == 2);
    assert(nlohmann::json::parse(lines[0])["row_hash"] == "hash-1");
    assert(nlohmann::json::parse(lines[1])["row_hash"] == "hash-3");
    std::filesystem::remove_all(dir);
    LOG_INFO << "Partial write rollback PASS";
}

class ThrowingSink : public EntrySink {
public:
    const char* name() const override { return "throwing"; }
    void Submit(const EntryPtr&) override { throw std::runtime_error("disk on fire"); }
};

class CountingSink : public EntrySink {
public:
    const char* name() const override { return "counting"; }
    void Submit(const EntryPtr&) override { ++count; }
    std::atomic<int> count{0};
};

void testFanoutIsolatesSinks() {
    ThrowingSink bad;
    CountingSink good;
    PersistenceFanout fanout;
    fanout.AddSink(&bad);
    fanout.AddSink(&good);
    assert(fanout.sinkCount() == 2);
    fanout.Persist(makeEntry(1));
    fanout.Persist(makeEntry(2));
    assert(good.count == 2);
    LOG_INFO << "Fanout isolation PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    testLazyDirectoryAndFormat();
    testConcurrentAppendsNeverInterleave();
    testUnwritableDirectoryIsReported();
    testPartialWriteIsRolledBack();
    testFanoutIsolatesSinks();
    return 0;
}
