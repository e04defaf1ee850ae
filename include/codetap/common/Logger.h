#pragma once

#include <string>
#include <mutex>
#include <sstream>

namespace codetap {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }
    // Unknown names map to INFO.
    static LogLevel ParseLevel(const std::string& levelStr);

    // Colors default to on only when stdout is a terminal.
    void SetColor(bool enabled);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool color_ = true;
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace codetap

#define CODETAP_LOG(lvl) \
    if (codetap::common::LogLevel::lvl >= codetap::common::Logger::Instance().GetLevel()) \
    codetap::common::LogStream(codetap::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG CODETAP_LOG(DEBUG)
#define LOG_INFO  CODETAP_LOG(INFO)
#define LOG_WARN  CODETAP_LOG(WARN)
#define LOG_ERROR CODETAP_LOG(ERROR)
#define LOG_FATAL CODETAP_LOG(FATAL)
