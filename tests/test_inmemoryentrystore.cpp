// tests/test_inmemoryentrystore.cpp
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "../src/core/CacheErrors.hpp"
#include "../src/store/InMemoryEntryStore.hpp"

using namespace std::chrono_literals;

class InMemoryEntryStoreTest : public ::testing::Test {
protected:
    InMemoryEntryStore store;

    static std::vector<std::string> sorted(std::vector<std::string> v) {
        std::sort(v.begin(), v.end());
        return v;
    }
};

TEST_F(InMemoryEntryStoreTest, SetAndGetItem) {
    store.set("key1", "value1");
    auto value = store.get("key1");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "value1");
}

TEST_F(InMemoryEntryStoreTest, GetNonExistentItem) {
    EXPECT_FALSE(store.get("missing").has_value());
    EXPECT_FALSE(store.exists("missing"));
}

TEST_F(InMemoryEntryStoreTest, OverwriteItem) {
    store.set("key1", "value1");
    store.set("key1", "value2");
    EXPECT_EQ(*store.get("key1"), "value2");
}

TEST_F(InMemoryEntryStoreTest, RemoveItem) {
    store.set("key1", "value1");
    EXPECT_TRUE(store.remove("key1"));
    EXPECT_FALSE(store.remove("key1"));
    EXPECT_FALSE(store.exists("key1"));
}

TEST_F(InMemoryEntryStoreTest, SetMembershipAndPruning) {
    store.addToSet("tags", "a");
    store.addToSet("tags", "b");
    store.addToSet("tags", "a");
    EXPECT_EQ(sorted(store.setMembers("tags")), (std::vector<std::string>{"a", "b"}));

    store.removeFromSet("tags", "a");
    EXPECT_TRUE(store.exists("tags"));
    store.removeFromSet("tags", "b");
    EXPECT_FALSE(store.exists("tags"));
    EXPECT_TRUE(store.setMembers("tags").empty());

    EXPECT_NO_THROW(store.removeFromSet("tags", "ghost"));
}

TEST_F(InMemoryEntryStoreTest, TypeMismatchIsStoreError) {
    store.set("value", "v");
    store.addToSet("set", "m");

    EXPECT_THROW(store.addToSet("value", "m"), StoreError);
    EXPECT_THROW(store.setMembers("value"), StoreError);
    EXPECT_THROW(store.get("set"), StoreError);

    // A plain set replaces whatever was stored
    store.set("set", "now a value");
    EXPECT_EQ(*store.get("set"), "now a value");
}

TEST_F(InMemoryEntryStoreTest, ScanAndCountByPrefix) {
    store.set("ns:entry:1", "a");
    store.set("ns:entry:2", "b");
    store.addToSet("ns:tag:T", "1");
    store.set("other:entry:1", "c");

    EXPECT_EQ(sorted(store.scanKeys("ns:entry:")), (std::vector<std::string>{"ns:entry:1", "ns:entry:2"}));
    EXPECT_EQ(store.countKeys("ns:tag:"), 1u);
    EXPECT_EQ(store.countKeys("ns:"), 3u);
    EXPECT_EQ(store.countKeys("none:"), 0u);
}

TEST_F(InMemoryEntryStoreTest, LockIsExclusiveUntilReleasedByHolder) {
    EXPECT_TRUE(store.lockTake("lock:1", "token-a", 10s));
    EXPECT_FALSE(store.lockTake("lock:1", "token-b", 10s));
    EXPECT_TRUE(store.exists("lock:1"));

    // Only the holder's token deletes the record
    EXPECT_FALSE(store.lockRelease("lock:1", "token-b"));
    EXPECT_TRUE(store.lockRelease("lock:1", "token-a"));
    EXPECT_FALSE(store.lockRelease("lock:1", "token-a"));

    EXPECT_TRUE(store.lockTake("lock:1", "token-b", 10s));
}

TEST_F(InMemoryEntryStoreTest, LockExpiresOnItsOwn) {
    EXPECT_TRUE(store.lockTake("lock:1", "token-a", 20ms));
    std::this_thread::sleep_for(40ms);

    EXPECT_FALSE(store.exists("lock:1"));
    EXPECT_TRUE(store.lockTake("lock:1", "token-b", 10s));
    // The original holder no longer owns it
    EXPECT_FALSE(store.lockRelease("lock:1", "token-a"));
}

TEST_F(InMemoryEntryStoreTest, LocksVisibleToScanOnlyWhileLive) {
    store.lockTake("ns:lock:1", "t", 20ms);
    EXPECT_EQ(store.countKeys("ns:lock:"), 1u);
    std::this_thread::sleep_for(40ms);
    EXPECT_EQ(store.countKeys("ns:lock:"), 0u);
}
