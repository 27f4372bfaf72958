#include "Logging.h"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace secret_guard {

bool parse_log_level(const std::string& text, LogLevel& out) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(s == "error") { out = LogLevel::Error; return true; }
    if(s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
    if(s == "info") { out = LogLevel::Info; return true; }
    if(s == "debug") { out = LogLevel::Debug; return true; }
    if(s == "trace") { out = LogLevel::Trace; return true; }
    return false;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

const char* Logger::prefix(LogLevel level) {
    switch(level) {
        case LogLevel::Error: return "[ERROR] ";
        case LogLevel::Warn: return "[WARN] ";
        case LogLevel::Info: return "[INFO] ";
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Trace: return "[TRACE] ";
    }
    return "";
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if(static_cast<int>(level) > static_cast<int>(level_)) return;
    std::cerr << prefix(level) << message << '\n';
}

} // namespace secret_guard
