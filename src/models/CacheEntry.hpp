#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <chrono>
#include <optional>
#include <set>
#include <string>

using TimePoint = std::chrono::system_clock::time_point;

namespace CacheTime {
    // Absolute expiration meaning "never"
    static const TimePoint NEVER = TimePoint::max();
}

// One cached value plus its expiration policy and dependency tags, as stored
// in the shared store.
class CacheEntry {
public:
    enum class State {
        Valid,
        AbsoluteExpired,
        SlidingExpired
    };

    std::string key;
    std::string payload; // Opaque bytes
    TimePoint absolute_expiration = CacheTime::NEVER;
    std::optional<std::chrono::milliseconds> sliding_expiration;
    TimePoint last_access;
    std::set<std::string> dependent_tags;

    // Absolute expiration is checked first and is a hard ceiling; sliding
    // expiration is measured from the stored last_access.
    State evaluate(TimePoint now) const;
    bool isAbsoluteExpired(TimePoint now) const { return now >= absolute_expiration; }
    void touch(TimePoint now) { last_access = now; }

    // CBOR document; timestamps in milliseconds since the Unix epoch.
    std::string serialize() const;
    // Throws StoreError when bytes is not a valid entry record.
    static CacheEntry deserialize(const std::string& bytes);

    std::string to_string() const;
};

#endif // CACHEENTRY_HPP
