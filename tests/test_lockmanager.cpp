// tests/test_lockmanager.cpp
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "mocks/Mocks.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/core/CacheErrors.hpp"
#include "../src/core/LockManager.hpp"
#include "../src/metrics/DummyStatsDClient.hpp"
#include "../src/store/InMemoryEntryStore.hpp"

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class LockManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemoryEntryStore> store = std::make_shared<InMemoryEntryStore>();
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    KeySpace key_space{"test:"};

    std::unique_ptr<LockManager> makeManager(std::chrono::milliseconds expiry = 30s) {
        return std::make_unique<LockManager>(store, key_space, expiry, logger, DummyStatsDClient::getInstance());
    }
};

TEST_F(LockManagerTest, ConstructorRejectsMissingCollaborators) {
    auto statsd = DummyStatsDClient::getInstance();
    EXPECT_THROW(LockManager(nullptr, key_space, 30s, logger, statsd), std::invalid_argument);
    EXPECT_THROW(LockManager(store, key_space, 30s, nullptr, statsd), std::invalid_argument);
    EXPECT_THROW(LockManager(store, key_space, 30s, logger, nullptr), std::invalid_argument);
    EXPECT_THROW(LockManager(store, key_space, 0ms, logger, statsd), std::invalid_argument);
}

TEST_F(LockManagerTest, AcquireWritesLockRecord) {
    auto locks = makeManager();
    LockToken token = locks->acquire("1", 100ms);

    EXPECT_EQ(token.key, "1");
    EXPECT_EQ(token.lock_key, "test:lock:1");
    EXPECT_EQ(token.token.size(), 32u);
    EXPECT_TRUE(store->exists("test:lock:1"));

    locks->release(token);
    EXPECT_TRUE(token.released);
    EXPECT_FALSE(store->exists("test:lock:1"));
}

TEST_F(LockManagerTest, TokensAreUnique) {
    auto locks = makeManager();
    LockToken a = locks->acquire("a", 100ms);
    LockToken b = locks->acquire("b", 100ms);
    EXPECT_NE(a.token, b.token);
    locks->release(a);
    locks->release(b);
}

TEST_F(LockManagerTest, HeldLockTimesOutAfterWaitWindow) {
    auto locks = makeManager();
    LockToken held = locks->acquire("1", 100ms);

    auto start = std::chrono::steady_clock::now();
    try {
        locks->acquire("1", 60ms);
        FAIL() << "Expected LockTimeoutError";
    } catch (const LockTimeoutError& e) {
        EXPECT_NE(std::string(e.what()).find("key: 1"), std::string::npos);
    }
    EXPECT_GE(std::chrono::steady_clock::now() - start, 60ms);

    // Other keys are independent
    LockToken other = locks->acquire("2", 10ms);
    locks->release(other);
    locks->release(held);
}

TEST_F(LockManagerTest, ZeroWaitTimeoutTriesOnce) {
    auto locks = makeManager();
    LockToken held = locks->acquire("1", 0ms);
    EXPECT_THROW(locks->acquire("1", 0ms), LockTimeoutError);
    locks->release(held);
}

TEST_F(LockManagerTest, WaiterGetsLockOnceReleased) {
    auto locks = makeManager();
    LockToken held = locks->acquire("1", 100ms);

    std::thread releaser([&]() {
        std::this_thread::sleep_for(30ms);
        locks->release(held);
    });
    LockToken next;
    EXPECT_NO_THROW(next = locks->acquire("1", 2s));
    releaser.join();
    locks->release(next);
}

TEST_F(LockManagerTest, UnboundedWaitTimeoutWaitsForRelease) {
    auto locks = makeManager();
    LockToken held = locks->acquire("k", 100ms);

    std::thread releaser([&]() {
        std::this_thread::sleep_for(50ms);
        locks->release(held);
    });
    auto start = std::chrono::steady_clock::now();
    LockToken next;
    EXPECT_NO_THROW(next = locks->acquire("k", std::chrono::milliseconds::max()));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
    releaser.join();
    locks->release(next);
}

TEST_F(LockManagerTest, ReleaseIsIdempotent) {
    auto locks = makeManager();
    LockToken token = locks->acquire("1", 100ms);
    locks->release(token);

    LockToken successor = locks->acquire("1", 100ms);
    // A second release of the old token must not free the successor's lock
    locks->release(token);
    EXPECT_TRUE(store->exists("test:lock:1"));
    locks->release(successor);
}

TEST_F(LockManagerTest, ExpiredLockCanBeRetaken) {
    auto locks = makeManager(30ms);
    LockToken abandoned = locks->acquire("1", 100ms);
    std::this_thread::sleep_for(50ms);

    LockToken next = locks->acquire("1", 10ms);

    EXPECT_CALL(*logger, warn(HasSubstr("had already expired"))).Times(1);
    locks->release(abandoned);
    // The stale release left the new holder alone
    EXPECT_TRUE(store->exists("test:lock:1"));
    locks->release(next);
}

TEST_F(LockManagerTest, MutualExclusionAcrossThreads) {
    auto locks = makeManager();
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&]() {
            for (int j = 0; j < 20; ++j) {
                ScopedKeyLock lock(*locks, "shared", 5s);
                int now_inside = ++inside;
                int seen = max_inside.load();
                while (now_inside > seen && !max_inside.compare_exchange_weak(seen, now_inside)) {
                }
                --inside;
                lock.release();
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }
    EXPECT_EQ(max_inside.load(), 1);
}

TEST_F(LockManagerTest, ScopedLockReleasedOnException) {
    auto locks = makeManager();
    try {
        ScopedKeyLock lock(*locks, "1", 100ms);
        throw StoreError("boom");
    } catch (const StoreError&) {
    }
    EXPECT_FALSE(store->exists("test:lock:1"));
}

TEST_F(LockManagerTest, ScopedLockTimeoutLeavesNothingToRelease) {
    auto locks = makeManager();
    LockToken held = locks->acquire("1", 100ms);
    EXPECT_THROW({ ScopedKeyLock lock(*locks, "1", 10ms); }, LockTimeoutError);
    EXPECT_TRUE(store->exists("test:lock:1"));
    locks->release(held);
}

TEST(LockManagerStoreFailureTest, ReleaseQuietlyLogsStoreErrors) {
    auto store = std::make_shared<NiceMock<MockEntryStore>>();
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    ON_CALL(*store, lockTake(_, _, _)).WillByDefault(Return(true));
    ON_CALL(*store, lockRelease(_, _)).WillByDefault(Throw(ConnectivityError("connection lost")));

    LockManager locks(store, KeySpace(), 30s, logger, DummyStatsDClient::getInstance());
    LockToken token = locks.acquire("1", 100ms);

    EXPECT_CALL(*logger, error(HasSubstr("connection lost"))).Times(1);
    locks.releaseQuietly(token);
    EXPECT_TRUE(token.released);
}

TEST(LockManagerStoreFailureTest, ReleasePropagatesStoreErrors) {
    auto store = std::make_shared<NiceMock<MockEntryStore>>();
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    ON_CALL(*store, lockTake(_, _, _)).WillByDefault(Return(true));
    ON_CALL(*store, lockRelease(_, _)).WillByDefault(Throw(ConnectivityError("connection lost")));

    LockManager locks(store, KeySpace(), 30s, logger, DummyStatsDClient::getInstance());
    LockToken token = locks.acquire("1", 100ms);
    EXPECT_THROW(locks.release(token), ConnectivityError);
}

TEST(LockManagerStoreFailureTest, AcquirePropagatesStoreErrors) {
    auto store = std::make_shared<NiceMock<MockEntryStore>>();
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    EXPECT_CALL(*store, lockTake(_, _, _)).WillOnce(Throw(ConnectivityError("unreachable")));
    EXPECT_CALL(*statsd, timing(_, _)).Times(0);

    LockManager locks(store, KeySpace(), 30s, logger, statsd);
    EXPECT_THROW(locks.acquire("1", 100ms), ConnectivityError);
}

TEST(LockManagerStoreFailureTest, AcquireRecordsWaitTiming) {
    auto store = std::make_shared<NiceMock<MockEntryStore>>();
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    EXPECT_CALL(*store, lockTake("tagcache:lock:1", _, std::chrono::milliseconds(30000)))
        .WillOnce(Return(false))
        .WillOnce(Return(true));
    EXPECT_CALL(*statsd, timing(MetricsDefinitions::LOCK_WAIT, _)).Times(1);

    LockManager locks(store, KeySpace(), 30s, logger, statsd);
    LockToken token = locks.acquire("1", 1s);
    EXPECT_FALSE(token.released);
}
