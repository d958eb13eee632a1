#pragma once

#include <string>
#include <chrono>

namespace coderun {

enum class LogLevel {
    INFO,
    WARN,
    ERROR
};

// Write one timestamped line: "2024/01/02 15:04:05 [INFO] message".
// INFO goes to stdout, WARN and ERROR to stderr.
void log_message(LogLevel level, const std::string& message);

inline void log_info(const std::string& message) { log_message(LogLevel::INFO, message); }
inline void log_warn(const std::string& message) { log_message(LogLevel::WARN, message); }
inline void log_error(const std::string& message) { log_message(LogLevel::ERROR, message); }

// Human readable duration, e.g. "850us", "12.345ms", "2.5s"
std::string format_duration(std::chrono::steady_clock::duration duration);

} // namespace coderun
