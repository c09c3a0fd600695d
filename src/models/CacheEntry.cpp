#include "CacheEntry.hpp"

#include <cstdint>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/CacheErrors.hpp"

using json = nlohmann::json;
using namespace std::chrono;

namespace {
    int64_t toMillis(TimePoint tp) {
        return time_point_cast<milliseconds>(tp).time_since_epoch().count();
    }

    // Values beyond the clock's range saturate instead of overflowing
    TimePoint fromMillis(int64_t ms) {
        constexpr int64_t max_ms = duration_cast<milliseconds>(TimePoint::duration::max()).count();
        constexpr int64_t min_ms = duration_cast<milliseconds>(TimePoint::duration::min()).count();
        if (ms >= max_ms) {
            return CacheTime::NEVER;
        }
        if (ms <= min_ms) {
            return TimePoint::min();
        }
        return TimePoint(duration_cast<TimePoint::duration>(milliseconds(ms)));
    }
}

CacheEntry::State CacheEntry::evaluate(TimePoint now) const {
    if (isAbsoluteExpired(now)) {
        return State::AbsoluteExpired;
    }
    // Compare in milliseconds; a window may be as large as milliseconds::max()
    if (sliding_expiration && duration_cast<milliseconds>(now - last_access) > *sliding_expiration) {
        return State::SlidingExpired;
    }
    return State::Valid;
}

std::string CacheEntry::serialize() const {
    json j;
    j["key"] = key;
    j["payload"] = json::binary(std::vector<std::uint8_t>(payload.begin(), payload.end()));
    if (absolute_expiration == CacheTime::NEVER) {
        j["absolute_expiration_ms"] = nullptr;
    } else {
        j["absolute_expiration_ms"] = toMillis(absolute_expiration);
    }
    if (sliding_expiration) {
        j["sliding_expiration_ms"] = sliding_expiration->count();
    } else {
        j["sliding_expiration_ms"] = nullptr;
    }
    j["last_access_ms"] = toMillis(last_access);
    j["dependent_tags"] = dependent_tags;

    std::vector<std::uint8_t> cbor = json::to_cbor(j);
    return std::string(cbor.begin(), cbor.end());
}

CacheEntry CacheEntry::deserialize(const std::string& bytes) {
    try {
        json j = json::from_cbor(bytes);

        CacheEntry entry;
        entry.key = j.at("key").get<std::string>();
        const auto& payload = j.at("payload").get_binary();
        entry.payload.assign(payload.begin(), payload.end());

        const auto& absolute = j.at("absolute_expiration_ms");
        entry.absolute_expiration = absolute.is_null() ? CacheTime::NEVER : fromMillis(absolute.get<int64_t>());

        const auto& sliding = j.at("sliding_expiration_ms");
        if (!sliding.is_null()) {
            entry.sliding_expiration = milliseconds(sliding.get<int64_t>());
        }

        entry.last_access = fromMillis(j.at("last_access_ms").get<int64_t>());
        entry.dependent_tags = j.at("dependent_tags").get<std::set<std::string>>();
        return entry;
    } catch (const json::exception& e) {
        throw StoreError("Corrupt cache entry record: " + std::string(e.what()));
    }
}

std::string CacheEntry::to_string() const {
    std::ostringstream oss;
    oss << "CacheEntry {\n";
    oss << "  Key: " << key << "\n";
    oss << "  Payload bytes: " << payload.size() << "\n";
    if (absolute_expiration == CacheTime::NEVER) {
        oss << "  Absolute expiration: never\n";
    } else {
        oss << "  Absolute expiration (ms): " << toMillis(absolute_expiration) << "\n";
    }
    if (sliding_expiration) {
        oss << "  Sliding expiration (ms): " << sliding_expiration->count() << "\n";
    }
    oss << "  Last access (ms): " << toMillis(last_access) << "\n";
    oss << "  Tags:";
    for (const auto& tag : dependent_tags) {
        oss << " " << tag;
    }
    oss << "\n}";
    return oss.str();
}
