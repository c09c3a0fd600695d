#ifndef LOCKMANAGER_HPP
#define LOCKMANAGER_HPP

#include <chrono>
#include <memory>
#include <string>

#include "KeySpace.hpp"
#include "../interfaces/IEntryStore.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/LockToken.hpp"

// Per-key mutex living in the shared store, so exclusion holds across processes.
class LockManager {
public:
    LockManager(std::shared_ptr<IEntryStore> store,
                KeySpace key_space,
                std::chrono::milliseconds lock_expiry,
                std::shared_ptr<ILogger> logger,
                std::shared_ptr<IStatsDClient> statsd_client);

    // Polls the store with exponential backoff. Throws LockTimeoutError when the
    // lock is not granted within wait_timeout; store failures propagate as thrown.
    LockToken acquire(const std::string& key, std::chrono::milliseconds wait_timeout);

    // Idempotent. Only the holder's token can delete the lock record.
    void release(LockToken& token);
    // For unwinding paths: failures are logged instead of thrown.
    void releaseQuietly(LockToken& token) noexcept;

    std::chrono::milliseconds lockExpiry() const { return lock_expiry_; }

private:
    static std::string newToken();

    std::shared_ptr<IEntryStore> store_;
    KeySpace key_space_;
    std::chrono::milliseconds lock_expiry_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};

// Holds one key's lock for the lifetime of a critical section. release() is the
// normal exit and lets store errors propagate; the destructor covers every
// other path and only logs.
class ScopedKeyLock {
public:
    ScopedKeyLock(LockManager& manager, const std::string& key, std::chrono::milliseconds wait_timeout);
    ~ScopedKeyLock();

    ScopedKeyLock(const ScopedKeyLock&) = delete;
    ScopedKeyLock& operator=(const ScopedKeyLock&) = delete;

    void release();
    const LockToken& token() const { return token_; }

private:
    LockManager& manager_;
    LockToken token_;
};

#endif // LOCKMANAGER_HPP
