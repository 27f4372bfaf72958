#pragma once
#include <mutex>
#include <string>

namespace secret_guard {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3, Trace = 4 };

// Parses "error", "warn", "info", "debug", "trace" (case-insensitive).
bool parse_log_level(const std::string& text, LogLevel& out);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void log(LogLevel level, const std::string& message);
    void error(const std::string& message) { log(LogLevel::Error, message); }
    void warn(const std::string& message) { log(LogLevel::Warn, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void trace(const std::string& message) { log(LogLevel::Trace, message); }

private:
    Logger() = default;
    static const char* prefix(LogLevel level);

    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::Warn;
};

} // namespace secret_guard
