#include "LockManager.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "CacheErrors.hpp"
#include "../config/AppConfig.hpp" // For MetricsDefinitions

using namespace std::chrono;

namespace {
    constexpr milliseconds INITIAL_BACKOFF{1};
    constexpr milliseconds MAX_BACKOFF{50};
}

LockManager::LockManager(std::shared_ptr<IEntryStore> store,
                         KeySpace key_space,
                         milliseconds lock_expiry,
                         std::shared_ptr<ILogger> logger,
                         std::shared_ptr<IStatsDClient> statsd_client)
    : store_(std::move(store)),
      key_space_(std::move(key_space)),
      lock_expiry_(lock_expiry),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)) {
    if (!store_) {
        throw std::invalid_argument("Entry store cannot be null for LockManager");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for LockManager");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for LockManager");
    }
    if (lock_expiry_ <= milliseconds::zero()) {
        throw std::invalid_argument("Lock expiry must be positive");
    }
}

LockToken LockManager::acquire(const std::string& key, milliseconds wait_timeout) {
    LockToken token;
    token.key = key;
    token.lock_key = key_space_.lockKey(key);
    token.token = newToken();

    const auto start = steady_clock::now();
    // A wait longer than the clock can represent means no deadline
    const auto headroom = duration_cast<milliseconds>(steady_clock::time_point::max() - start);
    const auto deadline = wait_timeout >= headroom ? steady_clock::time_point::max() : start + wait_timeout;
    milliseconds backoff = INITIAL_BACKOFF;

    while (!store_->lockTake(token.lock_key, token.token, lock_expiry_)) {
        const auto now = steady_clock::now();
        if (now >= deadline) {
            throw LockTimeoutError("Timed out after " + std::to_string(wait_timeout.count()) +
                                   "ms waiting for the lock on key: " + key);
        }
        // Never sleep past the deadline
        auto remaining = duration_cast<milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::max(milliseconds(1), std::min(backoff, remaining)));
        backoff = std::min(backoff * 2, MAX_BACKOFF);
    }

    statsd_client_->timing(MetricsDefinitions::LOCK_WAIT, duration_cast<milliseconds>(steady_clock::now() - start));
    return token;
}

void LockManager::release(LockToken& token) {
    if (token.released) {
        return;
    }
    token.released = true;
    if (!store_->lockRelease(token.lock_key, token.token)) {
        // The record expired (lock_expiry) and may now belong to someone else
        logger_->warn("Lock on key '" + token.key + "' had already expired before release");
    }
}

void LockManager::releaseQuietly(LockToken& token) noexcept {
    if (token.released) {
        return;
    }
    try {
        release(token);
    } catch (const std::exception& e) {
        // The record still expires on its own after lock_expiry
        logger_->error("Failed to release lock on key '" + token.key + "': " + e.what());
    }
}

std::string LockManager::newToken() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << generator()
        << std::setw(16) << generator();
    return oss.str();
}

ScopedKeyLock::ScopedKeyLock(LockManager& manager, const std::string& key, milliseconds wait_timeout)
    : manager_(manager), token_(manager.acquire(key, wait_timeout)) {}

ScopedKeyLock::~ScopedKeyLock() {
    manager_.releaseQuietly(token_);
}

void ScopedKeyLock::release() {
    manager_.release(token_);
}
