// =============================================================================
// Log.cpp
// =============================================================================

#include "Log.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace SegmentedDownloader {

std::string currentTime() {
    auto now   = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    auto ms    = std::chrono::duration_cast<std::chrono::milliseconds>(
                     now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&timeT, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

namespace {

const char* levelName(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::OFF:   return "OFF";
    }
    return "?";
}

} // namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level) const {
    if (level == LogLevel::OFF) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return level_ != LogLevel::OFF &&
           static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::write(LogLevel level, const std::string& tag,
                   const std::string& message) {
    const std::string stamp = currentTime();
    std::lock_guard<std::mutex> lock(mutex_);
    std::clog << "[" << stamp << "][" << levelName(level) << "][" << tag
              << "] " << message << "\n" << std::flush;
}

} // namespace SegmentedDownloader
