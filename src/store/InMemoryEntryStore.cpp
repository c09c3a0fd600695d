#include "InMemoryEntryStore.hpp"

#include <chrono>

#include "../core/CacheErrors.hpp"

using namespace std::chrono;

namespace {
    bool hasPrefix(const std::string& key, const std::string& prefix) {
        return key.compare(0, prefix.size(), prefix) == 0;
    }
}

std::optional<std::string> InMemoryEntryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureNotSet(key);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryEntryStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    // SET overwrites whatever type was stored before
    sets_.erase(key);
    values_[key] = value;
}

bool InMemoryEntryStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = values_.erase(key) > 0;
    removed = sets_.erase(key) > 0 || removed;
    return removed;
}

bool InMemoryEntryStore::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    dropExpiredLock(key);
    return values_.count(key) > 0 || sets_.count(key) > 0 || locks_.count(key) > 0;
}

void InMemoryEntryStore::addToSet(const std::string& set_key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureNotValue(set_key);
    sets_[set_key].insert(member);
}

void InMemoryEntryStore::removeFromSet(const std::string& set_key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureNotValue(set_key);
    auto it = sets_.find(set_key);
    if (it == sets_.end()) {
        return;
    }
    it->second.erase(member);
    if (it->second.empty()) {
        sets_.erase(it);
    }
}

std::vector<std::string> InMemoryEntryStore::setMembers(const std::string& set_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureNotValue(set_key);
    auto it = sets_.find(set_key);
    if (it == sets_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> InMemoryEntryStore::scanKeys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& [key, value] : values_) {
        if (hasPrefix(key, prefix)) keys.push_back(key);
    }
    for (const auto& [key, members] : sets_) {
        if (hasPrefix(key, prefix)) keys.push_back(key);
    }
    const auto now = steady_clock::now();
    for (const auto& [key, record] : locks_) {
        if (record.expiry > now && hasPrefix(key, prefix)) keys.push_back(key);
    }
    return keys;
}

std::size_t InMemoryEntryStore::countKeys(const std::string& prefix) {
    return scanKeys(prefix).size();
}

bool InMemoryEntryStore::lockTake(const std::string& lock_key, const std::string& token, milliseconds expiry) {
    std::lock_guard<std::mutex> lock(mutex_);
    dropExpiredLock(lock_key);
    if (locks_.count(lock_key) > 0) {
        return false;
    }
    locks_[lock_key] = LockRecord{token, steady_clock::now() + expiry};
    return true;
}

bool InMemoryEntryStore::lockRelease(const std::string& lock_key, const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    dropExpiredLock(lock_key);
    auto it = locks_.find(lock_key);
    if (it == locks_.end() || it->second.token != token) {
        return false;
    }
    locks_.erase(it);
    return true;
}

void InMemoryEntryStore::dropExpiredLock(const std::string& lock_key) {
    auto it = locks_.find(lock_key);
    if (it != locks_.end() && it->second.expiry <= steady_clock::now()) {
        locks_.erase(it);
    }
}

void InMemoryEntryStore::ensureNotSet(const std::string& key) const {
    if (sets_.count(key) > 0) {
        throw StoreError("WRONGTYPE Operation against a key holding a set: " + key);
    }
}

void InMemoryEntryStore::ensureNotValue(const std::string& key) const {
    if (values_.count(key) > 0) {
        throw StoreError("WRONGTYPE Operation against a key holding a string: " + key);
    }
}
