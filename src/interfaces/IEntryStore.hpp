#ifndef IENTRYSTORE_HPP
#define IENTRYSTORE_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Boundary to the shared backing store. Implementations report failures by
// throwing ConnectivityError or StoreError (see core/CacheErrors.hpp).
class IEntryStore {
public:
    virtual ~IEntryStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual bool exists(const std::string& key) = 0;

    // Set records. Removing the last member deletes the record.
    virtual void addToSet(const std::string& set_key, const std::string& member) = 0;
    virtual void removeFromSet(const std::string& set_key, const std::string& member) = 0;
    virtual std::vector<std::string> setMembers(const std::string& set_key) = 0;

    // Every record whose key starts with prefix, and how many there are.
    virtual std::vector<std::string> scanKeys(const std::string& prefix) = 0;
    virtual std::size_t countKeys(const std::string& prefix) = 0;

    // Distributed lock primitive. lockTake succeeds only when no other token
    // holds lock_key; the record expires on its own after expiry.
    // lockRelease deletes the record only while it still carries token.
    virtual bool lockTake(const std::string& lock_key, const std::string& token, std::chrono::milliseconds expiry) = 0;
    virtual bool lockRelease(const std::string& lock_key, const std::string& token) = 0;
};

#endif // IENTRYSTORE_HPP
