// tests/test_cacheentry.cpp
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

#include "../src/core/CacheErrors.hpp"
#include "../src/models/CacheEntry.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

class CacheEntryTest : public ::testing::Test {
protected:
    TimePoint now = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    CacheEntry entry;

    void SetUp() override {
        entry.key = "key";
        entry.payload = "payload";
        entry.last_access = now;
    }
};

TEST_F(CacheEntryTest, NoExpirationIsAlwaysValid) {
    EXPECT_EQ(entry.evaluate(now), CacheEntry::State::Valid);
    EXPECT_EQ(entry.evaluate(now + 24h * 365), CacheEntry::State::Valid);
}

TEST_F(CacheEntryTest, AbsoluteExpirationIsInclusive) {
    entry.absolute_expiration = now + 10s;
    EXPECT_EQ(entry.evaluate(now + 9s), CacheEntry::State::Valid);
    EXPECT_EQ(entry.evaluate(now + 10s), CacheEntry::State::AbsoluteExpired);
    EXPECT_TRUE(entry.isAbsoluteExpired(now + 11s));
}

TEST_F(CacheEntryTest, SlidingExpirationMeasuredFromLastAccess) {
    entry.sliding_expiration = 10s;
    EXPECT_EQ(entry.evaluate(now + 10s), CacheEntry::State::Valid);
    EXPECT_EQ(entry.evaluate(now + 10s + 1ms), CacheEntry::State::SlidingExpired);

    entry.touch(now + 8s);
    EXPECT_EQ(entry.evaluate(now + 15s), CacheEntry::State::Valid);
}

TEST_F(CacheEntryTest, NegativeSlidingExpirationExpiresImmediately) {
    entry.sliding_expiration = -1ms;
    EXPECT_EQ(entry.evaluate(now), CacheEntry::State::SlidingExpired);
}

TEST_F(CacheEntryTest, AbsoluteCheckedBeforeSliding) {
    entry.sliding_expiration = 1s;
    entry.absolute_expiration = now + 1s;
    EXPECT_EQ(entry.evaluate(now + 5s), CacheEntry::State::AbsoluteExpired);
}

TEST_F(CacheEntryTest, SerializedRecordKeepsAllFields) {
    entry.payload = std::string("\0bin\xfe", 5);
    entry.absolute_expiration = now + 1h;
    entry.sliding_expiration = 30s;
    entry.dependent_tags = {"ES1", "ES2"};

    CacheEntry restored = CacheEntry::deserialize(entry.serialize());

    EXPECT_EQ(restored.key, "key");
    EXPECT_EQ(restored.payload, entry.payload);
    EXPECT_EQ(restored.absolute_expiration, entry.absolute_expiration);
    ASSERT_TRUE(restored.sliding_expiration.has_value());
    EXPECT_EQ(*restored.sliding_expiration, 30s);
    EXPECT_EQ(restored.last_access, now);
    EXPECT_EQ(restored.dependent_tags, entry.dependent_tags);
}

TEST_F(CacheEntryTest, NeverAndNoSlidingSurviveSerialization) {
    CacheEntry restored = CacheEntry::deserialize(entry.serialize());

    EXPECT_EQ(restored.absolute_expiration, CacheTime::NEVER);
    EXPECT_FALSE(restored.sliding_expiration.has_value());
    EXPECT_TRUE(restored.dependent_tags.empty());
}

TEST_F(CacheEntryTest, MaximalSlidingExpirationIsValid) {
    entry.sliding_expiration = std::chrono::milliseconds::max();
    EXPECT_EQ(entry.evaluate(now + 1s), CacheEntry::State::Valid);
    EXPECT_EQ(entry.evaluate(now + 24h * 365 * 200), CacheEntry::State::Valid);
}

TEST_F(CacheEntryTest, OutOfRangeTimestampsSaturate) {
    json record = json::from_cbor(entry.serialize());
    record["absolute_expiration_ms"] = std::numeric_limits<int64_t>::max();
    record["last_access_ms"] = std::numeric_limits<int64_t>::min();
    std::vector<std::uint8_t> cbor = json::to_cbor(record);

    CacheEntry restored = CacheEntry::deserialize(std::string(cbor.begin(), cbor.end()));

    EXPECT_EQ(restored.absolute_expiration, CacheTime::NEVER);
    EXPECT_EQ(restored.last_access, TimePoint::min());
    EXPECT_EQ(restored.evaluate(now), CacheEntry::State::Valid);
}

TEST_F(CacheEntryTest, CorruptRecordThrowsStoreError) {
    EXPECT_THROW(CacheEntry::deserialize("not a record"), StoreError);
    EXPECT_THROW(CacheEntry::deserialize(""), StoreError);

    // Record cut short in transit
    std::string truncated = entry.serialize();
    truncated.resize(truncated.size() / 2);
    EXPECT_THROW(CacheEntry::deserialize(truncated), StoreError);
}

TEST_F(CacheEntryTest, ToStringDescribesEntry) {
    entry.dependent_tags = {"ES1"};
    std::string text = entry.to_string();
    EXPECT_NE(text.find("Key: key"), std::string::npos);
    EXPECT_NE(text.find("Absolute expiration: never"), std::string::npos);
    EXPECT_NE(text.find("Tags: ES1"), std::string::npos);
}
