#include "logger.h"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace coderun {

namespace {

std::mutex log_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::INFO: return "[INFO]";
        case LogLevel::WARN: return "[WARN]";
        case LogLevel::ERROR: return "[ERROR]";
    }
    return "[INFO]";
}

std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);

    std::ostringstream out;
    out << std::put_time(&local_tm, "%Y/%m/%d %H:%M:%S");
    return out.str();
}

} // namespace

void log_message(LogLevel level, const std::string& message) {
    std::string line = timestamp() + " " + level_tag(level) + " " + message;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (level == LogLevel::INFO) {
        std::cout << line << std::endl;
    } else {
        std::cerr << line << std::endl;
    }
}

std::string format_duration(std::chrono::steady_clock::duration duration) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(duration).count();

    std::ostringstream out;
    if (us < 1000) {
        out << us << "us";
    } else if (us < 1000 * 1000) {
        out << std::fixed << std::setprecision(3) << (us / 1000.0) << "ms";
    } else {
        out << std::fixed << std::setprecision(3) << (us / 1000000.0) << "s";
    }
    return out.str();
}

} // namespace coderun
