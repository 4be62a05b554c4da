#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace folio {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

inline const char* log_level_prefix(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "[DEBUG] ";
        case LogLevel::INFO:    return "[INFO] ";
        case LogLevel::WARNING: return "[WARN] ";
        case LogLevel::ERROR:   return "[ERROR] ";
    }
    return "";
}

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    virtual void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

    bool enabled(LogLevel level) const { return level >= min_level_; }

protected:
    LogLevel min_level_ = LogLevel::INFO;
};

/**
 * Writes "[LEVEL] message" lines to an output stream.
 * The stream must outlive the logger.
 */
class StreamLogger : public Logger {
public:
    explicit StreamLogger(std::ostream& out) : out_(out) {}

    void log(LogLevel level, const std::string& message) override {
        if (!enabled(level)) return;
        out_ << log_level_prefix(level) << message << '\n';
    }

private:
    std::ostream& out_;
};

// Diagnostics go to stderr so tool output on stdout stays clean
class ConsoleLogger : public StreamLogger {
public:
    ConsoleLogger() : StreamLogger(std::cerr) {}
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}

    // Level stays fixed, null_logger() is shared by every collection
    void set_min_level(LogLevel) override {}
};

// Shared do-nothing logger used when no logger is configured
inline Logger& null_logger() {
    static NullLogger instance;
    return instance;
}

}  // namespace folio
