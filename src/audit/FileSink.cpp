#include "codetap/audit/FileSink.h"
#include "codetap/network/EventLoop.h"
#include "codetap/network/EventLoopThread.h"
#include "codetap/common/Logger.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <future>
#include <system_error>

namespace codetap {
namespace audit {

const char FileSink::kFileName[] = "traffic.jsonl";

FileSink::FileSink(const std::string& logDir)
    : logDir_(logDir),
      path_((std::filesystem::path(logDir) / kFileName).string()),
      thread_(new codetap::network::EventLoopThread("file-sink")) {
    loop_ = thread_->StartLoop();
}

FileSink::~FileSink() {
    // quit and join first so queued writes finish before the file closes
    thread_.reset();
    std::lock_guard<std::mutex> lock(mutex_);
    if (fp_) {
        std::fflush(fp_);
        std::fclose(fp_);
        fp_ = nullptr;
    }
}

bool FileSink::OpenLocked() {
    if (fp_) return true;
    std::error_code ec;
    std::filesystem::create_directories(logDir_, ec);
    if (ec) {
        LOG_ERROR << "FileSink: cannot create " << logDir_ << ": " << ec.message();
        return false;
    }
    fp_ = std::fopen(path_.c_str(), "a");
    if (!fp_) {
        LOG_ERROR << "FileSink: fopen failed path=" << path_ << ": " << std::strerror(errno);
        return false;
    }
    return true;
}

bool FileSink::AppendLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!OpenLocked()) return false;
    // every earlier line was flushed, so the file size is where this one starts
    struct stat st;
    if (::fstat(::fileno(fp_), &st) != 0) {
        LOG_ERROR << "FileSink: fstat failed path=" << path_ << ": " << std::strerror(errno);
        std::fclose(fp_);
        fp_ = nullptr;
        return false;
    }
    const off_t before = st.st_size;
    const size_t n = std::fwrite(line.data(), 1, line.size(), fp_);
    const size_t nl = std::fwrite("\n", 1, 1, fp_);
    if (n != line.size() || nl != 1 || std::fflush(fp_) != 0) {
        const int savedErrno = errno;
        LOG_ERROR << "FileSink: write failed path=" << path_ << ": " << std::strerror(savedErrno);
        // close before cutting so no buffered bytes land after the cut; reopen on the next write
        std::fclose(fp_);
        fp_ = nullptr;
        if (::truncate(path_.c_str(), before) != 0) {
            LOG_ERROR << "FileSink: cannot drop partial line path=" << path_ << ": " << std::strerror(errno);
        }
        return false;
    }
    return true;
}

void FileSink::Submit(const EntryPtr& entry) {
    EntryPtr keep = entry;
    loop_->QueueInLoop([this, keep]() {
        try {
            if (!AppendLine(DumpJson(ToJson(*keep)))) {
                LOG_ERROR << "FileSink: entry " << keep->rowHash << " not persisted";
            }
        } catch (const std::exception& e) {
            LOG_ERROR << "FileSink: entry " << keep->rowHash << " not persisted: " << e.what();
        }
    });
}

void FileSink::Flush() {
    if (loop_->IsInLoopThread()) return;
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> waited = done->get_future();
    loop_->QueueInLoop([done]() { done->set_value(); });
    waited.wait();
}

} // namespace audit
} // namespace codetap
