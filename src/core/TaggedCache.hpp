#ifndef TAGGEDCACHE_HPP
#define TAGGEDCACHE_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "CacheErrors.hpp"
#include "FailureChannel.hpp"
#include "KeySpace.hpp"
#include "LockManager.hpp"
#include "TagIndex.hpp"
#include "../config/CacheSettings.hpp"
#include "../interfaces/IEntryStore.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/CacheEntry.hpp"

using json = nlohmann::json;

// Write-through cache over a shared store with tag-based invalidation.
//
// Every store-touching operation runs under the per-key distributed lock of the
// key it changes. Store and lock failures never escape: they are logged, counted
// and published on failures(), and the call returns its "nothing happened"
// result. Only ArgumentError is thrown, before the store is touched.
class TaggedCache {
public:
    using TagList = std::vector<std::string>;

    // Connects a RedisEntryStore using the opaque connection configuration.
    // Null logger / statsd client fall back to ConsoleLogger / DummyStatsDClient.
    explicit TaggedCache(const std::string& connection_configuration,
                         std::shared_ptr<ILogger> logger = nullptr,
                         std::shared_ptr<IStatsDClient> statsd_client = nullptr);

    TaggedCache(std::shared_ptr<IEntryStore> store,
                CacheSettings settings,
                std::shared_ptr<ILogger> logger = nullptr,
                std::shared_ptr<IStatsDClient> statsd_client = nullptr);

    TaggedCache(const TaggedCache&) = delete;
    TaggedCache& operator=(const TaggedCache&) = delete;

    // dependent_tags must be supplied (std::nullopt is rejected); an empty list is fine.
    void putItem(const std::string& key,
                 const std::string& value,
                 const std::optional<TagList>& dependent_tags,
                 std::optional<std::chrono::milliseconds> sliding_expiration = std::nullopt,
                 TimePoint absolute_expiration = CacheTime::NEVER);
    void putItemJson(const std::string& key,
                     const json& value,
                     const std::optional<TagList>& dependent_tags,
                     std::optional<std::chrono::milliseconds> sliding_expiration = std::nullopt,
                     TimePoint absolute_expiration = CacheTime::NEVER);

    // A hit refreshes the stored last access time.
    std::optional<std::string> getItem(const std::string& key);
    std::optional<json> getItemJson(const std::string& key);

    void invalidateItem(const std::string& key);
    void invalidateSets(const std::optional<TagList>& tags);

    // Removes absolute-expired entries and tag records left without live entries.
    void purge();

    // Live entries plus live tag records. Diagnostic only.
    std::size_t count();

    std::chrono::milliseconds lockWaitTimeout() const;
    void setLockWaitTimeout(std::chrono::milliseconds timeout);

    FailureChannel& failures() { return failures_; }

private:
    TimePoint now() const;
    std::optional<CacheEntry> loadEntry(const std::string& key);
    void removeEntry(const CacheEntry& entry);
    void removeMembership(const std::string& tag, const std::string& key);
    void reportFailure(const std::string& operation, std::exception_ptr cause);

    // Runs body; a CacheError is reported under operation and false returned.
    template <typename Fn>
    bool guarded(const std::string& operation, Fn&& body) {
        try {
            body();
            return true;
        } catch (const CacheError&) {
            reportFailure(operation, std::current_exception());
            return false;
        }
    }

    std::shared_ptr<IEntryStore> store_;
    CacheSettings settings_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    KeySpace key_space_;
    std::unique_ptr<TagIndex> tag_index_;
    std::unique_ptr<LockManager> lock_manager_;
    FailureChannel failures_;
    std::atomic<long long> lock_wait_timeout_ms_;
};

#endif // TAGGEDCACHE_HPP
