#pragma once

#include <string>
#include <mutex>
#include <sstream>
#include <ostream>

namespace linkgate {
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
    LogLevel ParseLevel(const std::string& levelStr);

    // Colors are only emitted when the sink is a terminal.
    void SetColorEnabled(bool on);
    // Redirect output (tests). nullptr restores stdout.
    void SetSink(std::ostream* sink);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool color_ = false;
    std::ostream* sink_ = nullptr;
    std::mutex mutex_;
};

// Usage: LOG_INFO << "session " << id << " bound";
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
} // namespace linkgate

#define LINKGATE_LOG_AT(lvl) \
    if (linkgate::common::LogLevel::lvl >= linkgate::common::Logger::Instance().GetLevel()) \
    linkgate::common::LogStream(linkgate::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG LINKGATE_LOG_AT(DEBUG)
#define LOG_INFO LINKGATE_LOG_AT(INFO)
#define LOG_WARN LINKGATE_LOG_AT(WARN)
#define LOG_ERROR LINKGATE_LOG_AT(ERROR)
#define LOG_FATAL LINKGATE_LOG_AT(FATAL)
