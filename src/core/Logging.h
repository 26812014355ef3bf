#pragma once
#include <string>
#include <mutex>
#include <atomic>

namespace revkit {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3, Trace = 4 };

// Process-wide stderr logger. Writes are serialized; level changes are atomic.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }

    void log(LogLevel level, const std::string& msg);
    void error(const std::string& msg) { log(LogLevel::Error, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void trace(const std::string& msg) { log(LogLevel::Trace, msg); }

private:
    Logger() = default;
    static const char* prefix(LogLevel level);

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

// Accepts error|warn|info|debug|trace (case-insensitive).
bool parse_log_level(const std::string& text, LogLevel& out);

}
