#include "TaggedCache.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>
#include <utility>

#include "../config/AppConfig.hpp" // For MetricsDefinitions
#include "../logging/ConsoleLogger.hpp"
#include "../metrics/DummyStatsDClient.hpp"
#include "../store/RedisEntryStore.hpp"

using namespace std::chrono;

namespace {
    const std::string FAILURE_MESSAGE_PREFIX = "Caching failed for ";

    std::shared_ptr<ILogger> orDefault(std::shared_ptr<ILogger> logger) {
        if (logger) return logger;
        return ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR);
    }

    std::shared_ptr<IStatsDClient> orDefault(std::shared_ptr<IStatsDClient> statsd_client) {
        if (statsd_client) return statsd_client;
        return DummyStatsDClient::getInstance();
    }

    void requireKey(const std::string& key) {
        if (key.empty()) {
            throw ArgumentError("key", ArgumentError::Reason::Empty, "Cache key cannot be empty");
        }
    }

    const char* describe(CacheEntry::State state) {
        return state == CacheEntry::State::AbsoluteExpired ? "absolute expiration reached"
                                                           : "sliding expiration elapsed";
    }
}

TaggedCache::TaggedCache(const std::string& connection_configuration,
                         std::shared_ptr<ILogger> logger,
                         std::shared_ptr<IStatsDClient> statsd_client)
    : TaggedCache(std::make_shared<RedisEntryStore>(connection_configuration, orDefault(logger)),
                  CacheSettings(),
                  orDefault(logger),
                  std::move(statsd_client)) {}

TaggedCache::TaggedCache(std::shared_ptr<IEntryStore> store,
                         CacheSettings settings,
                         std::shared_ptr<ILogger> logger,
                         std::shared_ptr<IStatsDClient> statsd_client)
    : store_(std::move(store)),
      settings_(std::move(settings)),
      logger_(orDefault(std::move(logger))),
      statsd_client_(orDefault(std::move(statsd_client))),
      key_space_(settings_.key_namespace),
      lock_wait_timeout_ms_(settings_.lock_wait_timeout.count()) {
    if (!store_) {
        throw std::invalid_argument("Entry store cannot be null for TaggedCache");
    }
    if (settings_.lock_wait_timeout < milliseconds::zero()) {
        throw std::invalid_argument("Lock wait timeout cannot be negative");
    }
    tag_index_ = std::make_unique<TagIndex>(store_, key_space_);
    lock_manager_ = std::make_unique<LockManager>(store_, key_space_, settings_.lock_expiry, logger_, statsd_client_);
    logger_->debug("TaggedCache initialized with namespace '" + settings_.key_namespace + "'");
}

void TaggedCache::putItem(const std::string& key,
                          const std::string& value,
                          const std::optional<TagList>& dependent_tags,
                          std::optional<milliseconds> sliding_expiration,
                          TimePoint absolute_expiration) {
    requireKey(key);
    if (!dependent_tags) {
        throw ArgumentError("dependentTags", ArgumentError::Reason::Unset,
                            "Dependent tags must be provided (an empty list is allowed)");
    }

    CacheEntry entry;
    entry.key = key;
    entry.payload = value;
    entry.absolute_expiration = absolute_expiration;
    entry.sliding_expiration = sliding_expiration;
    entry.last_access = now();
    entry.dependent_tags.insert(dependent_tags->begin(), dependent_tags->end());
    const std::string record = entry.serialize();

    guarded("putItem", [&]() {
        ScopedKeyLock lock(*lock_manager_, key, lockWaitTimeout());

        // Drop memberships the replaced entry declared but this one does not
        if (auto previous = loadEntry(key)) {
            std::set<std::string> stale;
            std::set_difference(previous->dependent_tags.begin(), previous->dependent_tags.end(),
                                entry.dependent_tags.begin(), entry.dependent_tags.end(),
                                std::inserter(stale, stale.end()));
            tag_index_->removeKey(stale, key);
        }

        store_->set(key_space_.entryKey(key), record);
        tag_index_->addKey(entry.dependent_tags, key);
        lock.release();
        statsd_client_->increment(MetricsDefinitions::CACHE_PUT);
    });
}

void TaggedCache::putItemJson(const std::string& key,
                              const json& value,
                              const std::optional<TagList>& dependent_tags,
                              std::optional<milliseconds> sliding_expiration,
                              TimePoint absolute_expiration) {
    putItem(key, value.dump(), dependent_tags, sliding_expiration, absolute_expiration);
}

std::optional<std::string> TaggedCache::getItem(const std::string& key) {
    requireKey(key);

    std::optional<std::string> result;
    bool ok = guarded("getItem", [&]() {
        ScopedKeyLock lock(*lock_manager_, key, lockWaitTimeout());

        auto entry = loadEntry(key);
        if (entry) {
            const TimePoint current = now();
            const CacheEntry::State state = entry->evaluate(current);
            if (state == CacheEntry::State::Valid) {
                // Persist the refreshed access time so other processes see it
                entry->touch(current);
                store_->set(key_space_.entryKey(key), entry->serialize());
                result = std::move(entry->payload);
            } else {
                logger_->debug("Cache entry '" + key + "' expired: " + describe(state));
                removeEntry(*entry);
                statsd_client_->increment(MetricsDefinitions::CACHE_EXPIRED);
            }
        }
        lock.release();
    });
    if (!ok) {
        result.reset();
    }

    statsd_client_->increment(result ? MetricsDefinitions::CACHE_HIT : MetricsDefinitions::CACHE_MISS);
    return result;
}

std::optional<json> TaggedCache::getItemJson(const std::string& key) {
    auto str_value = getItem(key);
    if (!str_value) {
        return std::nullopt;
    }

    try {
        return json::parse(*str_value);
    } catch (const json::parse_error& e) {
        logger_->error("JSON parse error for key '" + key + "': " + e.what());
        return std::nullopt;
    }
}

void TaggedCache::invalidateItem(const std::string& key) {
    requireKey(key);

    guarded("invalidateItem", [&]() {
        ScopedKeyLock lock(*lock_manager_, key, lockWaitTimeout());
        if (auto entry = loadEntry(key)) {
            removeEntry(*entry);
            statsd_client_->increment(MetricsDefinitions::CACHE_INVALIDATED);
        }
        lock.release();
    });
}

void TaggedCache::invalidateSets(const std::optional<TagList>& tags) {
    if (!tags) {
        throw ArgumentError("tags", ArgumentError::Reason::Unset, "Tags to invalidate must be provided");
    }

    for (const auto& tag : *tags) {
        std::vector<std::string> keys;
        if (!guarded("invalidateSets", [&]() { keys = tag_index_->keysFor(tag); })) {
            continue;
        }

        // Each member is removed under its own lock; a key already removed
        // through another tag is just dropped from this record.
        for (const auto& key : keys) {
            guarded("invalidateSets", [&]() {
                ScopedKeyLock lock(*lock_manager_, key, lockWaitTimeout());
                if (auto entry = loadEntry(key)) {
                    removeEntry(*entry);
                    statsd_client_->increment(MetricsDefinitions::CACHE_INVALIDATED);
                }
                tag_index_->removeKey(tag, key);
                lock.release();
            });
        }
        logger_->debug("Invalidated tag '" + tag + "' (" + std::to_string(keys.size()) + " keys)");
    }
}

void TaggedCache::purge() {
    guarded("purge", [&]() {
        const TimePoint current = now();

        std::set<std::string> entry_keys;
        for (const auto& entry_key : store_->scanKeys(key_space_.entryPrefix())) {
            entry_keys.insert(key_space_.keyFromEntryKey(entry_key));
        }

        std::size_t removed = 0;
        for (const auto& key : entry_keys) {
            guarded("purge", [&]() {
                ScopedKeyLock lock(*lock_manager_, key, lockWaitTimeout());
                auto entry = loadEntry(key);
                if (entry && entry->isAbsoluteExpired(current)) {
                    removeEntry(*entry);
                    ++removed;
                }
                lock.release();
            });
        }

        // Memberships whose entry is gone keep a tag record alive; drop them
        std::vector<std::string> tag_names = tag_index_->tags();
        std::set<std::string> tags(tag_names.begin(), tag_names.end());
        for (const auto& tag : tags) {
            guarded("purge", [&]() {
                for (const auto& key : tag_index_->keysFor(tag)) {
                    if (store_->exists(key_space_.entryKey(key))) {
                        continue;
                    }
                    guarded("purge", [&]() { removeMembership(tag, key); });
                }
            });
        }

        logger_->info("Purge removed " + std::to_string(removed) + " expired entries");
    });
}

std::size_t TaggedCache::count() {
    std::size_t total = 0;
    guarded("count", [&]() {
        total = store_->countKeys(key_space_.entryPrefix()) + tag_index_->tagCount();
    });
    return total;
}

milliseconds TaggedCache::lockWaitTimeout() const {
    return milliseconds(lock_wait_timeout_ms_.load());
}

void TaggedCache::setLockWaitTimeout(milliseconds timeout) {
    if (timeout < milliseconds::zero()) {
        throw ArgumentError("lockWaitTimeout", ArgumentError::Reason::Invalid, "Lock wait timeout cannot be negative");
    }
    lock_wait_timeout_ms_.store(timeout.count());
}

TimePoint TaggedCache::now() const {
    return settings_.clock ? settings_.clock() : system_clock::now();
}

std::optional<CacheEntry> TaggedCache::loadEntry(const std::string& key) {
    auto record = store_->get(key_space_.entryKey(key));
    if (!record) {
        return std::nullopt;
    }
    try {
        return CacheEntry::deserialize(*record);
    } catch (const StoreError& e) {
        // Unreadable records are dropped; purge later clears their tag memberships
        logger_->error("Discarding unreadable cache entry '" + key + "': " + e.what());
        store_->remove(key_space_.entryKey(key));
        return std::nullopt;
    }
}

// Caller holds the entry's lock
void TaggedCache::removeEntry(const CacheEntry& entry) {
    store_->remove(key_space_.entryKey(entry.key));
    tag_index_->removeKey(entry.dependent_tags, entry.key);
}

void TaggedCache::removeMembership(const std::string& tag, const std::string& key) {
    ScopedKeyLock lock(*lock_manager_, key, lockWaitTimeout());
    // Re-check under the lock: a put may have landed since the scan
    if (!store_->exists(key_space_.entryKey(key))) {
        tag_index_->removeKey(tag, key);
    }
    lock.release();
}

void TaggedCache::reportFailure(const std::string& operation, std::exception_ptr cause) {
    CachingFailure failure{FAILURE_MESSAGE_PREFIX + operation, cause};
    logger_->error(failure.message + ": " + failure.causeMessage());
    statsd_client_->increment(MetricsDefinitions::CACHING_FAILED);
    if (failure.causeIs<LockTimeoutError>()) {
        statsd_client_->increment(MetricsDefinitions::LOCK_TIMEOUT);
    }
    failures_.publish(failure);
}
