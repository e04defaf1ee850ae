#pragma once

#include "codetap/audit/EntrySink.h"

#include <cstdio>
#include <memory>
#include <mutex>
#include <string>

namespace codetap {
namespace network {
class EventLoop;
class EventLoopThread;
}

namespace audit {

// Append-only JSONL store, one Entry per line. Writes run on a dedicated
// sink loop; a single mutex serializes whole lines.
class FileSink : public EntrySink {
public:
    static const char kFileName[];

    explicit FileSink(const std::string& logDir);
    ~FileSink() override;

    const char* name() const override { return "file"; }
    void Submit(const EntryPtr& entry) override;

    // Thread-safe; creates the directory and opens the file on first use.
    // Returns false (after logging) on I/O failure.
    bool AppendLine(const std::string& line);

    // Blocks until every Submit issued before the call has been written.
    void Flush();

    const std::string& path() const { return path_; }

private:
    bool OpenLocked();

    std::string logDir_;
    std::string path_;
    std::mutex mutex_;
    std::FILE* fp_{nullptr};

    std::unique_ptr<codetap::network::EventLoopThread> thread_;
    codetap::network::EventLoop* loop_{nullptr};
};

} // namespace audit
} // namespace codetap
