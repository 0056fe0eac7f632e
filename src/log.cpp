#include "grievance/log.hpp"

#include <stdexcept>

namespace grievance {

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel parse_log_level(const std::string& text) {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info")  return LogLevel::Info;
    if (text == "warn")  return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    if (text == "off")   return LogLevel::Off;
    throw std::invalid_argument("unknown log level '" + text +
        "', must be: debug, info, warn, error or off");
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) const {
    if (!enabled(level)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    *sink_ << "[" << to_string(level) << "] " << component << ": " << message << '\n';
}

} // namespace grievance
