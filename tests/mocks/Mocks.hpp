// tests/mocks/Mocks.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "gmock/gmock.h"

#include "../../src/interfaces/IEntryStore.hpp"
#include "../../src/interfaces/ILogger.hpp"
#include "../../src/interfaces/IStatsDClient.hpp"
#include "../../src/models/CacheEntry.hpp"

// --- Mock Logger ---
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, setup, (const std::string& message), (override));
    MOCK_METHOD(int, getLogLevel, (), (override));
};

// Mock class for StatsDClient
class MockStatsDClient : public IStatsDClient {
public:
    MOCK_METHOD(void, increment, (const std::string& key, int value), (override));
    MOCK_METHOD(void, decrement, (const std::string& key, int value), (override));
    MOCK_METHOD(void, gauge, (const std::string& key, double value), (override));
    MOCK_METHOD(void, timing, (const std::string& key, std::chrono::milliseconds value), (override));
    MOCK_METHOD(void, set, (const std::string& key, const std::string& value), (override));
};

// --- Mock Entry Store ---
class MockEntryStore : public IEntryStore {
public:
    MOCK_METHOD(std::optional<std::string>, get, (const std::string& key), (override));
    MOCK_METHOD(void, set, (const std::string& key, const std::string& value), (override));
    MOCK_METHOD(bool, remove, (const std::string& key), (override));
    MOCK_METHOD(bool, exists, (const std::string& key), (override));
    MOCK_METHOD(void, addToSet, (const std::string& set_key, const std::string& member), (override));
    MOCK_METHOD(void, removeFromSet, (const std::string& set_key, const std::string& member), (override));
    MOCK_METHOD(std::vector<std::string>, setMembers, (const std::string& set_key), (override));
    MOCK_METHOD(std::vector<std::string>, scanKeys, (const std::string& prefix), (override));
    MOCK_METHOD(std::size_t, countKeys, (const std::string& prefix), (override));
    MOCK_METHOD(bool, lockTake, (const std::string& lock_key, const std::string& token, std::chrono::milliseconds expiry), (override));
    MOCK_METHOD(bool, lockRelease, (const std::string& lock_key, const std::string& token), (override));
};

// Hand-driven time source for expiration tests
class ManualClock {
public:
    ManualClock()
        : now_(std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now())) {}

    TimePoint now() const { return now_; }
    void advance(std::chrono::milliseconds by) { now_ += by; }

private:
    TimePoint now_;
};
