#pragma once

#include <string>

// Sink for the cache's diagnostics. TaggedCache logs every absorbed failure at
// error level and expirations at debug; the store adapters log connects and
// lock releases that found the record already expired.
class ILogger {
public:
    virtual ~ILogger() noexcept = default;
    virtual void info(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    // tagcache_cli startup lines (store and metrics endpoints), printed regardless of level
    virtual void setup(const std::string& message) = 0;
    // A LogUtils::LogLevel value
    virtual int getLogLevel() = 0;
};
