#pragma once

#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

// Process-wide logger. Lines look like
//   2025-01-01T12:00:00.123Z [Error] Caching failed for getItem: ...
// Errors go to stderr, everything else to stdout.
class ConsoleLogger : public ILogger {
public:
    // The level passed on the first call wins; use setLogLevel to change it later.
    static std::shared_ptr<ConsoleLogger> getInstance(LogUtils::LogLevel log_level);

    void info(const std::string& message) override { log(LogUtils::LogLevel::INFO, message); }
    void debug(const std::string& message) override { log(LogUtils::LogLevel::DEBUG, message); }
    void warn(const std::string& message) override { log(LogUtils::LogLevel::WARN, message); }
    void error(const std::string& message) override { log(LogUtils::LogLevel::CERROR, message); }
    void setup(const std::string& message) override { log(LogUtils::LogLevel::SETUP, message); }
    int getLogLevel() override { return log_level_.load(); }
    void setLogLevel(LogUtils::LogLevel level) { log_level_.store(level); }

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;

private:
    explicit ConsoleLogger(LogUtils::LogLevel log_level) : log_level_(log_level) {}

    // SETUP lines bypass the level filter
    void log(LogUtils::LogLevel level, const std::string& message);
    static const std::string& prefixFor(LogUtils::LogLevel level);
    static std::string timestamp();

    std::atomic<int> log_level_;
    std::mutex write_mutex_;
};
