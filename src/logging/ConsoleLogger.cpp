#include "ConsoleLogger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

std::shared_ptr<ConsoleLogger> ConsoleLogger::getInstance(LogUtils::LogLevel log_level) {
    static const std::shared_ptr<ConsoleLogger> instance(new ConsoleLogger(log_level));
    return instance;
}

void ConsoleLogger::log(LogUtils::LogLevel level, const std::string& message) {
    if (level != LogUtils::LogLevel::SETUP && level < log_level_.load()) {
        return;
    }
    std::ostream& out = level == LogUtils::LogLevel::CERROR ? std::cerr : std::cout;
    const std::string line = timestamp() + " " + prefixFor(level) + message;

    std::lock_guard<std::mutex> lock(write_mutex_);
    out << line << std::endl;
}

const std::string& ConsoleLogger::prefixFor(LogUtils::LogLevel level) {
    switch (level) {
        case LogUtils::LogLevel::DEBUG: return LogUtils::DEBUG_LOG_PREFIX;
        case LogUtils::LogLevel::INFO: return LogUtils::INFO_LOG_PREFIX;
        case LogUtils::LogLevel::WARN: return LogUtils::WARN_LOG_PREFIX;
        case LogUtils::LogLevel::CERROR: return LogUtils::CERROR_LOG_PREFIX;
        default: return LogUtils::SETUP_LOG_PREFIX;
    }
}

std::string ConsoleLogger::timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm_now{};
    gmtime_r(&seconds, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, Constants::TIME_FORMAT)
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}
