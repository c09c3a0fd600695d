#ifndef CACHESETTINGS_HPP
#define CACHESETTINGS_HPP

#include <chrono>
#include <functional>
#include <string>

#include "../models/CacheEntry.hpp"

// Engine-level knobs. Every field has a usable default.
class CacheSettings {
public:
    std::string key_namespace = "tagcache:";
    std::chrono::milliseconds lock_wait_timeout{5000};
    // Server-side lifetime of a lock record, bounds how long a crashed holder blocks a key
    std::chrono::milliseconds lock_expiry{30000};
    // Source of "now" for expiration; empty means system_clock::now
    std::function<TimePoint()> clock;
};

#endif // CACHESETTINGS_HPP
