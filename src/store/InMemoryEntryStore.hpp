#ifndef INMEMORYENTRYSTORE_HPP
#define INMEMORYENTRYSTORE_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "../interfaces/IEntryStore.hpp"

// Single-process stand-in for the shared store. Mirrors the Redis semantics the
// cache relies on: empty sets disappear, type mismatches are errors and lock
// records expire on their own.
class InMemoryEntryStore : public IEntryStore {
private:
    struct LockRecord {
        std::string token;
        std::chrono::steady_clock::time_point expiry;
    };

    std::unordered_map<std::string, std::string> values_;
    std::unordered_map<std::string, std::unordered_set<std::string>> sets_;
    std::unordered_map<std::string, LockRecord> locks_;

    mutable std::mutex mutex_;

    void dropExpiredLock(const std::string& lock_key); // Caller holds mutex_
    void ensureNotSet(const std::string& key) const;
    void ensureNotValue(const std::string& key) const;

public:
    InMemoryEntryStore() = default;
    ~InMemoryEntryStore() override = default;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;
    bool exists(const std::string& key) override;

    void addToSet(const std::string& set_key, const std::string& member) override;
    void removeFromSet(const std::string& set_key, const std::string& member) override;
    std::vector<std::string> setMembers(const std::string& set_key) override;

    std::vector<std::string> scanKeys(const std::string& prefix) override;
    std::size_t countKeys(const std::string& prefix) override;

    bool lockTake(const std::string& lock_key, const std::string& token, std::chrono::milliseconds expiry) override;
    bool lockRelease(const std::string& lock_key, const std::string& token) override;
};

#endif // INMEMORYENTRYSTORE_HPP
