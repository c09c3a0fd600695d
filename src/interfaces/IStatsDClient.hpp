#pragma once

#include <chrono>
#include <string>

// Metrics sink for the cache. Keys are the MetricsDefinitions names
// (tagcache.hit, tagcache.lock_wait, ...): hits, misses, puts, expirations,
// invalidations and failures are counters, lock waits are timings.
class IStatsDClient {
public:
    virtual ~IStatsDClient() = default;

    virtual void increment(const std::string& key, int value = 1) = 0;
    virtual void decrement(const std::string& key, int value = 1) = 0;
    virtual void gauge(const std::string& key, double value) = 0;
    virtual void timing(const std::string& key, std::chrono::milliseconds value) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
};
