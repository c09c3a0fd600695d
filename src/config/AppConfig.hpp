#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <string>
#include <sstream>

#include "CacheSettings.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };
    
    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CACHE_HIT = "tagcache.hit";
    static std::string CACHE_MISS = "tagcache.miss";
    static std::string CACHE_PUT = "tagcache.put";
    static std::string CACHE_EXPIRED = "tagcache.expired";
    static std::string CACHE_INVALIDATED = "tagcache.invalidated";
    static std::string CACHING_FAILED = "tagcache.failure";
    static std::string LOCK_TIMEOUT = "tagcache.lock_timeout";
    static std::string LOCK_WAIT = "tagcache.lock_wait";
}

namespace Constants {
    static constexpr auto TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Store configuration
    bool use_redis;
    std::string redis_connection; // Opaque, parsed by RedisEntryStore
    std::string key_namespace;

    // Locking
    int lock_wait_timeout_in_millis;
    int lock_expiry_in_millis;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    AppConfig() {
        // --- Set Defaults  ---
        use_redis = true;
        redis_connection = "localhost:6379,abortConnect=false";
        key_namespace = "tagcache:";
        lock_wait_timeout_in_millis = 5000;
        lock_expiry_in_millis = 30000;
        log_level = LogUtils::LogLevel::CERROR; // Default log level
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
    }

    CacheSettings cacheSettings() const {
        CacheSettings settings;
        settings.key_namespace = key_namespace;
        settings.lock_wait_timeout = std::chrono::milliseconds(lock_wait_timeout_in_millis);
        settings.lock_expiry = std::chrono::milliseconds(lock_expiry_in_millis);
        return settings;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Store Configuration --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_connection: " << redis_connection << std::endl
            << "key_namespace: " << key_namespace << std::endl
            << "// --- Locking --- //" << std::endl
            << "lock_wait_timeout_in_millis: " << lock_wait_timeout_in_millis << std::endl
            << "lock_expiry_in_millis: " << lock_expiry_in_millis << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
