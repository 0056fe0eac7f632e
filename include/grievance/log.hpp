#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace grievance {

enum class LogLevel { Debug, Info, Warn, Error, Off };

std::string to_string(LogLevel level);     // "DEBUG", "INFO", ...
LogLevel    parse_log_level(const std::string& text);

inline std::ostream& operator<<(std::ostream& os, LogLevel l) { return os << to_string(l); }

/**
 * Logger
 *
 * Writes one line per record, `[LEVEL] component: message`, to the sink it
 * was constructed with. Records below the configured level are dropped.
 * Safe to share between threads; the sink must outlive the logger.
 */
class Logger {
public:
    explicit Logger(std::ostream& sink = std::clog, LogLevel level = LogLevel::Info)
        : sink_(&sink), level_(level) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool enabled(LogLevel level) const {
        return level != LogLevel::Off && level >= level_;
    }

    LogLevel level() const { return level_; }

    void log(LogLevel level, const std::string& component, const std::string& message) const;

    void debug(const std::string& component, const std::string& message) const { log(LogLevel::Debug, component, message); }
    void info (const std::string& component, const std::string& message) const { log(LogLevel::Info,  component, message); }
    void warn (const std::string& component, const std::string& message) const { log(LogLevel::Warn,  component, message); }
    void error(const std::string& component, const std::string& message) const { log(LogLevel::Error, component, message); }

private:
    std::ostream*      sink_;
    LogLevel           level_;
    mutable std::mutex mutex_;
};

} // namespace grievance
