// @src/test/storage_engine.test.cpp
#include "gtest/gtest.h"
#include "flowstore/flowstore.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace flowstore;
using flowstore::storage::ErrorCode;
using flowstore::storage::StorageError;

namespace fs = std::filesystem;

namespace {

// Fails the first `failures` reads with a transient error.
class FlakyRecordStore : public InMemoryRecordStore {
public:
    explicit FlakyRecordStore(int failures) : remaining_failures_(failures) {}

    std::optional<Record> get(const std::string& key) const override {
        if (remaining_failures_ > 0) {
            --remaining_failures_;
            throw TransientStorageError(StorageError::unavailable("get", "backend busy"));
        }
        return InMemoryRecordStore::get(key);
    }

private:
    mutable int remaining_failures_;
};

class RejectingRecordStore : public InMemoryRecordStore {
public:
    void put(const std::string&, Record) override {
        throw StorageException(STORAGE_ERROR(ErrorCode::INTERNAL_ERROR, "backend refused the write"));
    }
};

class CountingErrorHandler : public storage::ErrorHandler {
public:
    void handleError(const storage::StorageError&) override { ++errors; }
    void handleCriticalError(const storage::StorageError&) override { ++critical; }

    std::atomic<int> errors{0};
    std::atomic<int> critical{0};
};

// Reads engine statistics from inside the callback.
class StatsReadingErrorHandler : public storage::ErrorHandler {
public:
    explicit StatsReadingErrorHandler(StorageEngine* engine) : engine_(engine) {}

    void handleError(const storage::StorageError&) override { observe(); }
    void handleCriticalError(const storage::StorageError&) override { observe(); }

    std::atomic<int> calls{0};
    json last_stats;

private:
    void observe() {
        last_stats = engine_->getStats();
        ++calls;
    }

    StorageEngine* engine_;
};

class FailingWalSink : public WalSink {
public:
    void consume(const std::vector<WalEntry>&) override {
        throw TransientStorageError(STORAGE_ERROR(ErrorCode::IO_WRITE_ERROR, "disk full"));
    }
};

} // namespace

class StorageEngineTest : public ::testing::Test {
protected:
    EngineConfig makeConfig() {
        EngineConfig config;
        config.maintenance_interval = std::chrono::milliseconds(0);
        config.encryption.key = "engine-test-key";
        config.encryption.kdf_iterations = 1000;
        config.clock = [this] { return now; };
        config.retry_sleeper = [](std::chrono::milliseconds) {};
        return config;
    }

    void SetUp() override {
        engine = std::make_unique<StorageEngine>(makeConfig());
    }

    void advance(std::chrono::milliseconds d) { now += d; }

    TimePoint now = TimePoint(std::chrono::milliseconds(1700000000000));
    std::unique_ptr<StorageEngine> engine;
};

TEST_F(StorageEngineTest, SetGetRemoveLifecycle) {
    const json ada = {{"name", "Ada"}, {"age", 37}};

    WriteResult written = engine->set("user:1", ada);
    EXPECT_EQ(written.key, "user:1");
    EXPECT_EQ(written.version, 1u);
    EXPECT_TRUE(written.encrypted);
    EXPECT_TRUE(engine->isInitialized());

    auto read = engine->get("user:1");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, ada);
    EXPECT_TRUE(engine->exists("user:1"));

    DeleteResult removed = engine->remove("user:1");
    EXPECT_TRUE(removed.existed);
    EXPECT_FALSE(engine->get("user:1").has_value());
    EXPECT_FALSE(engine->exists("user:1"));
}

TEST_F(StorageEngineTest, DeleteIsIdempotent) {
    EXPECT_FALSE(engine->remove("never-written").existed);
    engine->set("k", json{{"a", 1}});
    EXPECT_TRUE(engine->remove("k").existed);
    EXPECT_FALSE(engine->remove("k").existed);
}

TEST_F(StorageEngineTest, VersionsIncreaseAndRestartAfterRemove) {
    EXPECT_EQ(engine->set("k", 1).version, 1u);
    EXPECT_EQ(engine->set("k", 2).version, 2u);
    EXPECT_EQ(engine->set("k", 3).version, 3u);
    engine->remove("k");
    EXPECT_EQ(engine->set("k", 4).version, 1u);
}

TEST_F(StorageEngineTest, KeepsCreationTimeAcrossUpdates) {
    engine->set("k", 1);
    const TimePoint created = now;
    advance(std::chrono::seconds(5));
    engine->set("k", 2);
    auto record = engine->getRecordStore().get("k");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->metadata.created_at, created);
    EXPECT_EQ(record->metadata.updated_at, now);
}

TEST_F(StorageEngineTest, InvalidKeysAreRejected) {
    EXPECT_THROW(engine->set("", 1), InvalidKeyError);
    EXPECT_THROW(engine->set(std::string(251, 'k'), 1), InvalidKeyError);
    EXPECT_NO_THROW(engine->set(std::string(250, 'k'), 1));
    EXPECT_FALSE(engine->get("").has_value());
    EXPECT_FALSE(engine->exists(""));

    auto result = engine->tryGet("");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_KEY);
    EXPECT_GE(engine->getMetrics().errors(), 3u);
}

TEST_F(StorageEngineTest, ErrorRateCountsFailedOperations) {
    for (int i = 0; i < 3; ++i) {
        EXPECT_FALSE(engine->exists(""));
    }
    EXPECT_EQ(engine->getMetrics().reads(), 3u);
    EXPECT_DOUBLE_EQ(engine->getMetrics().errorRate(), 1.0);

    engine->set("a", json{{"theme", "dark"}});
    engine->set("b", json{{"theme", "dark"}});
    engine->set("c", json{{"theme", "dark"}});
    for (const std::string key : {"a", "b"}) {
        auto record = engine->getRecordStore().get(key);
        ASSERT_TRUE(record.has_value());
        record->payload.resize(record->payload.size() / 2);
        engine->getRecordStore().put(key, *record);
        engine->getCache().invalidate(key);
    }

    // One query skipping two records is one operation but two errors.
    EXPECT_EQ(engine->query(json{{"theme", "dark"}}).size(), 1u);
    EXPECT_EQ(engine->keys("*").size(), 3u);

    const auto& metrics = engine->getMetrics();
    EXPECT_EQ(metrics.totalOperations(), 8u);
    EXPECT_EQ(metrics.failedOperations(), 3u);
    EXPECT_EQ(metrics.errors(), 5u);
    EXPECT_DOUBLE_EQ(metrics.errorRate(), 3.0 / 8.0);
    EXPECT_EQ(engine->getStats()["operations"]["failedOperations"], 3);
}

TEST_F(StorageEngineTest, KeysMatchGlobInOrder) {
    engine->set("mood:2024-01-02", json{{"mood", "calm"}});
    engine->set("mood:2024-01-01", json{{"mood", "happy"}});
    engine->set("user:1", json{{"name", "Ada"}});

    EXPECT_EQ(engine->keys("mood:*"), (std::vector<std::string>{"mood:2024-01-01", "mood:2024-01-02"}));
    EXPECT_EQ(engine->keys().size(), 3u);
    EXPECT_TRUE(engine->keys("none:*").empty());

    KeysOptions page;
    page.offset = 1;
    page.limit = 1;
    EXPECT_EQ(engine->keys("*", page), (std::vector<std::string>{"mood:2024-01-02"}));
}

TEST_F(StorageEngineTest, QueryMatchesEveryFilterField) {
    engine->set("prefs:1", json{{"theme", "dark"}, {"size", 12}});
    engine->set("prefs:2", json{{"theme", "light"}, {"size", 12}});
    engine->set("prefs:3", json{{"theme", "dark"}, {"size", 14}});
    engine->set("other", json{{"theme", "dark"}});

    auto dark = engine->query(json{{"theme", "dark"}});
    ASSERT_EQ(dark.size(), 3u);
    EXPECT_FALSE(dark[0].contains("size")); // "other" sorts first
    EXPECT_EQ(dark[1]["size"], 12);

    auto narrowed = engine->query(json{{"theme", "dark"}, {"size", 14.0}});
    ASSERT_EQ(narrowed.size(), 1u);
    EXPECT_EQ(narrowed[0]["size"], 14);

    QueryOptions prefs_only;
    prefs_only.key_pattern = "prefs:*";
    EXPECT_EQ(engine->query(json{{"theme", "dark"}}, prefs_only).size(), 2u);

    QueryOptions limited;
    limited.limit = 1;
    EXPECT_EQ(engine->query(json{{"theme", "dark"}}, limited).size(), 1u);

    EXPECT_TRUE(engine->query(json{{"theme", "sepia"}}).empty());
    EXPECT_EQ(engine->query(json::object()).size(), 4u);
}

TEST_F(StorageEngineTest, QueryFallsBackToScanForUnindexedFields) {
    engine->set("a", json{{"tags", json::array({"x", "y"})}, {"flag", true}});
    engine->set("b", json{{"tags", json::array({"z"})}, {"flag", false}});

    auto by_array = engine->query(json{{"tags", json::array({"x", "y"})}});
    ASSERT_EQ(by_array.size(), 1u);
    auto by_bool = engine->query(json{{"flag", false}});
    ASSERT_EQ(by_bool.size(), 1u);
    EXPECT_EQ(by_bool[0]["tags"], json::array({"z"}));
}

TEST_F(StorageEngineTest, QueryIndexFollowsOverwriteAndDelete) {
    engine->set("prefs", json{{"theme", "dark"}});
    engine->set("prefs", json{{"theme", "light"}});
    EXPECT_TRUE(engine->query(json{{"theme", "dark"}}).empty());
    EXPECT_EQ(engine->query(json{{"theme", "light"}}).size(), 1u);
    engine->remove("prefs");
    EXPECT_TRUE(engine->query(json{{"theme", "light"}}).empty());
}

TEST_F(StorageEngineTest, QueryRejectsNonObjectFilter) {
    try {
        engine->query(json::array({1}));
        FAIL() << "expected StorageException";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_VALUE);
    }
}

TEST_F(StorageEngineTest, TruncatedCiphertextIsReportedAsCorrupt) {
    engine->set("secret", json{{"name", "Ada"}});
    engine->set("fine", json{{"name", "Ada"}});

    auto record = engine->getRecordStore().get("secret");
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->metadata.encrypted);
    record->payload.resize(record->payload.size() / 2);
    engine->getRecordStore().put("secret", *record);
    engine->getCache().invalidate("secret");

    EXPECT_THROW(engine->get("secret"), CorruptRecordError);

    auto result = engine->tryGet("secret");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::CHECKSUM_MISMATCH);

    // Query skips the broken record instead of failing.
    auto found = engine->query(json{{"name", "Ada"}});
    EXPECT_EQ(found.size(), 1u);

    auto recent = engine->getRecentErrors(10);
    ASSERT_FALSE(recent.empty());
    EXPECT_EQ(recent.back().code, ErrorCode::CHECKSUM_MISMATCH);
}

TEST_F(StorageEngineTest, CacheIsTransparent) {
    const json value = {{"name", "Ada"}};
    engine->set("k", value);

    EXPECT_EQ(engine->get("k").value_or(json()), value);
    EXPECT_GE(engine->getMetrics().cacheHits(), 1u);

    engine->getCache().clear();
    EXPECT_EQ(engine->get("k").value_or(json()), value);
    EXPECT_GE(engine->getMetrics().cacheMisses(), 1u);
    EXPECT_TRUE(engine->getCache().contains("k"));
}

TEST_F(StorageEngineTest, DisabledCacheGivesSameResults) {
    EngineConfig config = makeConfig();
    config.cache.enabled = false;
    StorageEngine uncached(config);
    uncached.set("k", json{{"a", 1}});
    EXPECT_EQ(uncached.get("k").value_or(json()), (json{{"a", 1}}));
    EXPECT_EQ(uncached.getCache().size(), 0u);
    EXPECT_EQ(uncached.getMetrics().cacheHits(), 0u);
}

TEST_F(StorageEngineTest, PerCallOptionsOverrideDefaults) {
    SetOptions plain;
    plain.encrypt = false;
    plain.compress = false;
    WriteResult result = engine->set("plain", json{{"text", std::string(5000, 'a')}}, plain);
    EXPECT_FALSE(result.encrypted);
    EXPECT_FALSE(result.compressed);

    WriteResult packed = engine->set("packed", json{{"text", std::string(5000, 'a')}});
    EXPECT_TRUE(packed.compressed);
    EXPECT_NE(packed.algorithm, CompressionAlgorithm::NONE);
    EXPECT_LT(packed.size, 5000u);
    EXPECT_EQ((*engine->get("packed"))["text"].get<std::string>().size(), 5000u);
}

TEST_F(StorageEngineTest, RecordsExpireAfterTtl) {
    SetOptions ttl;
    ttl.ttl = std::chrono::milliseconds(1000);
    engine->set("session", json{{"user", 1}}, ttl);
    engine->set("durable", json{{"user", 1}});

    advance(std::chrono::milliseconds(999));
    EXPECT_TRUE(engine->get("session").has_value());
    EXPECT_EQ(engine->keys().size(), 2u);

    advance(std::chrono::milliseconds(1));
    EXPECT_EQ(engine->keys(), (std::vector<std::string>{"durable"}));
    EXPECT_FALSE(engine->get("session").has_value());
    EXPECT_FALSE(engine->exists("session"));
    EXPECT_FALSE(engine->getRecordStore().contains("session"));
    EXPECT_EQ(engine->query(json{{"user", 1}}).size(), 1u);
    EXPECT_GE(engine->getMetrics().expired(), 1u);
}

TEST_F(StorageEngineTest, MaintenancePurgesExpiredRecords) {
    SetOptions ttl;
    ttl.ttl = std::chrono::milliseconds(10);
    engine->set("a", 1, ttl);
    engine->set("b", 2, ttl);
    advance(std::chrono::milliseconds(20));

    engine->runMaintenance();
    EXPECT_EQ(engine->getRecordStore().size(), 0u);
    EXPECT_EQ(engine->getMetrics().expired(), 2u);
}

TEST_F(StorageEngineTest, NonPositiveTtlIsRejected) {
    SetOptions ttl;
    ttl.ttl = std::chrono::milliseconds(0);
    try {
        engine->set("k", 1, ttl);
        FAIL() << "expected StorageException";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_VALUE);
    }
    EXPECT_FALSE(engine->exists("k"));
}

TEST_F(StorageEngineTest, RewriteWithoutTtlClearsExpiry) {
    SetOptions ttl;
    ttl.ttl = std::chrono::milliseconds(10);
    engine->set("k", 1, ttl);
    engine->set("k", 2);
    advance(std::chrono::seconds(1));
    EXPECT_EQ(engine->get("k").value_or(json()), json(2));
}

TEST_F(StorageEngineTest, CompareAndSetChecksVersion) {
    EXPECT_EQ(engine->compareAndSet("k", 0, json{{"n", 1}}).version, 1u);
    EXPECT_THROW(engine->compareAndSet("k", 0, json{{"n", 2}}), VersionConflictError);
    EXPECT_EQ(engine->compareAndSet("k", 1, json{{"n", 2}}).version, 2u);
    EXPECT_THROW(engine->compareAndSet("k", 1, json{{"n", 3}}), VersionConflictError);
    EXPECT_EQ(engine->get("k").value_or(json()), (json{{"n", 2}}));
}

TEST_F(StorageEngineTest, BackupsCanBeRestored) {
    SetOptions with_backup;
    with_backup.backup = true;
    engine->set("doc", json{{"rev", "first"}}, with_backup);
    advance(std::chrono::milliseconds(5));
    engine->set("doc", json{{"rev", "second"}});

    auto backups = engine->listBackups("doc");
    ASSERT_EQ(backups.size(), 1u);
    EXPECT_EQ(backups[0].version, 1u);
    EXPECT_EQ(backups[0].backup_id.rfind("backup_doc_", 0), 0u);

    WriteResult restored = engine->restoreBackup(backups[0].backup_id);
    EXPECT_EQ(restored.version, 3u);
    EXPECT_EQ(engine->get("doc").value_or(json()), (json{{"rev", "first"}}));

    RemoveOptions remove_with_backup;
    remove_with_backup.backup = true;
    engine->remove("doc", remove_with_backup);
    EXPECT_EQ(engine->listBackups("doc").size(), 2u);
    EXPECT_FALSE(engine->exists("doc"));

    try {
        engine->restoreBackup("backup_missing_1");
        FAIL() << "expected BACKUP_NOT_FOUND";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), ErrorCode::BACKUP_NOT_FOUND);
    }
}

TEST_F(StorageEngineTest, BatchOperations) {
    auto written = engine->mset({{"a", 1}, {"b", json{{"x", 2}}}});
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written.at("a").version, 1u);

    auto read = engine->mget({"a", "b", "missing", ""});
    ASSERT_EQ(read.size(), 4u);
    EXPECT_EQ(read.at("a").value_or(json()), json(1));
    EXPECT_EQ(read.at("b").value_or(json()), (json{{"x", 2}}));
    EXPECT_FALSE(read.at("missing").has_value());
    EXPECT_FALSE(read.at("").has_value());
}

TEST_F(StorageEngineTest, ScansHonourCancellationAndTimeout) {
    engine->set("k", 1);

    std::atomic<bool> cancel{true};
    KeysOptions cancelled;
    cancelled.control.cancel = &cancel;
    try {
        engine->keys("*", cancelled);
        FAIL() << "expected ScanAbortedError";
    } catch (const ScanAbortedError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CANCELLED);
    }

    QueryOptions expired;
    expired.control.timeout = std::chrono::milliseconds(0);
    try {
        engine->query(json::object(), expired);
        FAIL() << "expected ScanAbortedError";
    } catch (const ScanAbortedError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TIMEOUT);
    }

    cancel = false;
    EXPECT_EQ(engine->keys("*", cancelled).size(), 1u);
}

TEST_F(StorageEngineTest, TransientStoreFailuresAreRetried) {
    StorageEngine flaky(makeConfig(), std::make_unique<FlakyRecordStore>(2));
    WriteResult result = flaky.set("k", json{{"a", 1}});
    EXPECT_EQ(result.version, 1u);
    EXPECT_EQ(flaky.getMetrics().retries(), 2u);
    EXPECT_EQ(flaky.get("k").value_or(json()), (json{{"a", 1}}));
}

TEST_F(StorageEngineTest, ExhaustedRetriesSurfaceTheError) {
    EngineConfig config = makeConfig();
    config.retry.max_attempts = 3;
    StorageEngine flaky(config, std::make_unique<FlakyRecordStore>(100));
    EXPECT_THROW(flaky.set("k", 1), TransientStorageError);
    EXPECT_EQ(flaky.getMetrics().retries(), 2u);
    EXPECT_FALSE(flaky.get("k").has_value());
}

TEST_F(StorageEngineTest, WalEntryPrecedesStoreMutation) {
    StorageEngine rejecting(makeConfig(), std::make_unique<RejectingRecordStore>());
    EXPECT_THROW(rejecting.set("k", json{{"a", 1}}), StorageException);

    auto entries = rejecting.getWal().entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].operation, WalOperation::SET);
    EXPECT_EQ(entries[0].key, "k");
    EXPECT_EQ(rejecting.getRecordStore().size(), 0u);
}

TEST_F(StorageEngineTest, WalRecordsEveryMutation) {
    engine->set("a", 1);
    engine->set("b", 2);
    engine->remove("a");
    engine->remove("never");

    auto entries = engine->getWal().entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[2].operation, WalOperation::DELETE);
    EXPECT_EQ(entries[2].key, "a");
    EXPECT_LT(entries[0].lsn, entries[1].lsn);
}

TEST_F(StorageEngineTest, DisabledWalRecordsNothing) {
    EngineConfig config = makeConfig();
    config.wal.enabled = false;
    StorageEngine no_wal(config);
    no_wal.set("a", 1);
    EXPECT_EQ(no_wal.getWal().size(), 0u);
}

TEST_F(StorageEngineTest, WalSinkFileReceivesEntriesOnShutdown) {
    const fs::path dir = fs::temp_directory_path() / "flowstore_engine_wal_sink";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const std::string path = (dir / "wal.log").string();

    {
        EngineConfig config = makeConfig();
        config.wal_sink_path = path;
        StorageEngine durable(config);
        durable.set("user:1", json{{"name", "Ada"}});
        durable.remove("user:1");
        durable.shutdown();
    }

    auto entries = FileWalSink::readAll(path);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].operation, WalOperation::SET);
    EXPECT_EQ(entries[0].value.value_or(json()), (json{{"name", "Ada"}}));
    EXPECT_EQ(entries[1].operation, WalOperation::DELETE);
    fs::remove_all(dir);
}

TEST_F(StorageEngineTest, ShutdownIsFinal) {
    engine->set("k", 1);
    engine->shutdown();
    EXPECT_FALSE(engine->isInitialized());

    try {
        engine->set("k", 2);
        FAIL() << "expected STORAGE_SHUT_DOWN";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), ErrorCode::STORAGE_SHUT_DOWN);
    }
    EXPECT_FALSE(engine->get("k").has_value());
    EXPECT_THROW(engine->init(), StorageException);
    EXPECT_NO_THROW(engine->shutdown());
}

TEST_F(StorageEngineTest, StatsCoverEverySection) {
    engine->set("a", json{{"theme", "dark"}});
    engine->get("a");
    engine->get("missing");

    json stats = engine->getStats();
    for (const char* section : {"storage", "performance", "operations", "cache", "compression", "encryption",
                                "resources", "health", "config"}) {
        EXPECT_TRUE(stats.contains(section)) << section;
    }
    EXPECT_EQ(stats["storage"]["records"], 1);
    EXPECT_EQ(stats["operations"]["writes"], 1);
    EXPECT_EQ(stats["operations"]["reads"], 2);
    EXPECT_EQ(stats["encryption"]["enabled"], true);
    EXPECT_EQ(stats["encryption"]["scheme"], "AES256_GCM_HKDF_DAILY");
    EXPECT_FALSE(stats["config"].contains("encryptionKey"));
    EXPECT_GT(stats["storage"]["memoryUsage"].get<size_t>(), 0u);
}

TEST_F(StorageEngineTest, HealthCheckRunsSelfTestAndCleansUp) {
    engine->set("a", 1);
    HealthReport report = engine->healthCheck();
    EXPECT_TRUE(report.test_passed);
    EXPECT_TRUE(report.healthy) << (report.issues.empty() ? "" : report.issues.front());
    EXPECT_TRUE(engine->isHealthy());
    EXPECT_TRUE(engine->keys(std::string(HealthMonitor::SELF_TEST_KEY_PREFIX) + "*").empty());
    EXPECT_EQ(engine->getStats()["health"]["checksRun"], 1);
}

TEST_F(StorageEngineTest, ConcurrentHealthChecksWithinOneMillisecondAllPass) {
    // The clock is frozen, so every self-test starts in the same millisecond.
    constexpr int kThreads = 4;
    constexpr int kChecksPerThread = 10;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kChecksPerThread; ++i) {
                if (!engine->healthCheck().test_passed) ++failures;
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_TRUE(engine->keys(std::string(HealthMonitor::SELF_TEST_KEY_PREFIX) + "*").empty());
    EXPECT_EQ(engine->getStats()["health"]["checksRun"], kThreads * kChecksPerThread);
}

TEST_F(StorageEngineTest, TinyMemoryLimitLeavesCacheEmpty) {
    EngineConfig config = makeConfig();
    config.max_memory_size = 3;
    config.health.self_test_enabled = false;
    StorageEngine tiny(config);
    ASSERT_EQ(tiny.getCache().budget(), std::optional<size_t>(0));

    tiny.set("k", json{{"v", 1}});
    auto value = tiny.get("k");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["v"], 1);
    EXPECT_EQ(tiny.getCache().size(), 0u);
    EXPECT_EQ(tiny.getCache().bytes(), 0u);
}

TEST_F(StorageEngineTest, HighMemoryUsageForcesLowMemoryMode) {
    EngineConfig config = makeConfig();
    config.max_memory_size = 64 * 1024;
    config.governor.low_memory_max_bytes = 32 * 1024;
    config.health.self_test_enabled = false;
    config.compression.enabled = false;
    StorageEngine small(config);
    for (int i = 0; i < 40; ++i) {
        small.set("k" + std::to_string(i), json{{"blob", std::string(1500, static_cast<char>('a' + i % 26))}});
    }

    HealthReport report = small.healthCheck();
    EXPECT_TRUE(report.memory_pressure_detected);
    EXPECT_FALSE(report.healthy);
    EXPECT_TRUE(small.getGovernor().lowMemoryMode());
    EXPECT_LE(small.getCache().bytes(), *small.getCache().budget());
}

TEST_F(StorageEngineTest, ResourceStateDrivesPolicy) {
    ResourceState state;
    state.memory_pressure = 0.95;
    ResourcePolicy policy = engine->updateResourceState(state);
    EXPECT_TRUE(policy.low_memory_mode);
    EXPECT_EQ(*engine->getCache().budget(), policy.cache_budget);

    state.memory_pressure = 0.1;
    EXPECT_FALSE(engine->updateResourceState(state).low_memory_mode);
}

TEST_F(StorageEngineTest, ResourceStateIsSampledDuringMaintenance) {
    auto probe = std::make_shared<StaticResourceProbe>();
    EngineConfig config = makeConfig();
    config.health.self_test_enabled = false;
    StorageEngine probed(config, nullptr, probe);
    probed.init();

    ResourceState state;
    state.battery_constrained = true;
    probe->set(state);
    probed.runMaintenance();
    EXPECT_TRUE(probed.getGovernor().currentPolicy().battery_optimization);
    EXPECT_EQ(probed.getGovernor().currentPolicy().wal_batch_size, 10u);
}

TEST_F(StorageEngineTest, ErrorsReachTheHandler) {
    auto handler = std::make_shared<CountingErrorHandler>();
    engine->setErrorHandler(handler);
    EXPECT_THROW(engine->set("", 1), InvalidKeyError);
    EXPECT_EQ(handler->errors.load(), 1);

    auto recent = engine->getRecentErrors(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].code, ErrorCode::INVALID_KEY);
}

TEST_F(StorageEngineTest, ErrorHandlerMayCallBackIntoTheEngine) {
    engine->set("broken", json{{"theme", "dark"}});
    engine->set("u:1", json{{"theme", "dark"}});
    auto record = engine->getRecordStore().get("broken");
    ASSERT_TRUE(record.has_value());
    record->payload.resize(record->payload.size() / 2);
    engine->getRecordStore().put("broken", *record);
    engine->getCache().invalidate("broken");

    auto handler = std::make_shared<StatsReadingErrorHandler>(engine.get());
    engine->setErrorHandler(handler);

    auto found = engine->query(json{{"theme", "dark"}});
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(handler->calls.load(), 1);
    EXPECT_TRUE(handler->last_stats.contains("storage"));

    engine->attachWalSink(std::make_shared<FailingWalSink>());
    engine->set("u:2", json{{"theme", "light"}});
    engine->runMaintenance();
    EXPECT_EQ(handler->calls.load(), 2);
}

TEST_F(StorageEngineTest, EncryptedRecordsNeedTheSameKey) {
    engine->set("k", json{{"secret", true}});
    auto record = engine->getRecordStore().get("k");
    ASSERT_TRUE(record.has_value());

    EngineConfig other_config = makeConfig();
    other_config.encryption.key = "a-different-key";
    StorageEngine other(other_config);
    other.getRecordStore().put("k", *record);
    EXPECT_THROW(other.get("k"), DecryptionError);

    StorageEngine same(makeConfig());
    same.getRecordStore().put("k", *record);
    EXPECT_EQ(same.get("k").value_or(json()), (json{{"secret", true}}));
}

TEST_F(StorageEngineTest, ConfigFromJsonBuildsWorkingEngine) {
    EngineConfig config = EngineConfig::fromJson(json{
        {"encryptionEnabled", false},
        {"compressionEnabled", false},
        {"maintenanceInterval", 0},
        {"retryAttempts", 2},
    });
    StorageEngine plain(config);
    WriteResult result = plain.set("k", json{{"a", 1}});
    EXPECT_FALSE(result.encrypted);
    EXPECT_FALSE(result.compressed);
    EXPECT_EQ(plain.getStats()["encryption"]["enabled"], false);
}
