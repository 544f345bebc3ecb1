// @src/test/record_store.test.cpp
#include "gtest/gtest.h"
#include "flowstore/record_store.h"

#include <string>
#include <vector>

using namespace flowstore;

namespace {

Record makeRecord(const std::string& payload) {
    Record record;
    record.payload = payload;
    record.metadata.size = payload.size();
    record.metadata.version = 1;
    return record;
}

} // namespace

class InMemoryRecordStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* key : {"mood:2024-01-01", "mood:2024-01-02", "user:1", "user:10", "a.b", "axb"}) {
            store.put(key, makeRecord("{}"));
        }
    }

    InMemoryRecordStore store;
};

TEST_F(InMemoryRecordStoreTest, ScanKeysIsSortedAndAnchored) {
    EXPECT_EQ(store.scanKeys("mood:*"), (std::vector<std::string>{"mood:2024-01-01", "mood:2024-01-02"}));
    EXPECT_EQ(store.scanKeys("user:?"), (std::vector<std::string>{"user:1"}));
    EXPECT_EQ(store.scanKeys("user:*"), (std::vector<std::string>{"user:1", "user:10"}));
    EXPECT_TRUE(store.scanKeys("ood:*").empty());
    EXPECT_EQ(store.scanKeys("*").size(), 6u);
}

TEST_F(InMemoryRecordStoreTest, RegexMetacharactersAreLiteral) {
    EXPECT_EQ(store.scanKeys("a.b"), (std::vector<std::string>{"a.b"}));
    EXPECT_EQ(store.scanKeys("a?b"), (std::vector<std::string>{"a.b", "axb"}));
    EXPECT_TRUE(store.scanKeys("(user)*").empty());
}

TEST_F(InMemoryRecordStoreTest, WildcardsMatchLineBreaks) {
    InMemoryRecordStore fresh;
    for (const char* key : {"mood:1", "mood:a\nb", "mood:a\rb", "mood:\n"}) {
        fresh.put(key, makeRecord("{}"));
    }
    EXPECT_EQ(fresh.scanKeys("mood:*"), fresh.scanKeys("*"));
    EXPECT_EQ(fresh.scanKeys("mood:*").size(), 4u);
    EXPECT_EQ(fresh.scanKeys("mood:?"), (std::vector<std::string>{"mood:\n", "mood:1"}));
    EXPECT_EQ(fresh.scanKeys("mood:a?b"), (std::vector<std::string>{"mood:a\nb", "mood:a\rb"}));
}

TEST_F(InMemoryRecordStoreTest, PayloadBytesTracksPutAndRemove) {
    InMemoryRecordStore fresh;
    fresh.put("k", makeRecord("12345"));
    EXPECT_EQ(fresh.payloadBytes(), 6u);
    fresh.put("k", makeRecord("12"));
    EXPECT_EQ(fresh.payloadBytes(), 3u);
    EXPECT_TRUE(fresh.remove("k"));
    EXPECT_EQ(fresh.payloadBytes(), 0u);
    EXPECT_FALSE(fresh.remove("k"));
}

TEST_F(InMemoryRecordStoreTest, TouchUpdatesAccessStatistics) {
    TimePoint now = Clock::now();
    EXPECT_TRUE(store.touch("user:1", now));
    EXPECT_TRUE(store.touch("user:1", now));
    auto record = store.get("user:1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->metadata.access_count, 2u);
    EXPECT_EQ(record->metadata.last_accessed_at, now);
    EXPECT_FALSE(store.touch("missing", now));
}

TEST_F(InMemoryRecordStoreTest, GetReturnsCopy) {
    auto record = store.get("user:1");
    ASSERT_TRUE(record.has_value());
    record->payload = "changed";
    EXPECT_EQ(store.get("user:1")->payload, "{}");
}
