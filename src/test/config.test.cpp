// @src/test/config.test.cpp
#include "gtest/gtest.h"
#include "flowstore/config.h"
#include "flowstore/storage_error/exceptions.h"

#include <cstdlib>
#include <functional>

using namespace flowstore;
using flowstore::storage::ErrorCode;

namespace {

ErrorCode codeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ConfigurationError& e) {
        return e.code();
    }
    return ErrorCode::OK;
}

} // namespace

TEST(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.max_memory_size, 50u * 1024 * 1024);
    EXPECT_EQ(config.retry.max_attempts, 5u);
    EXPECT_EQ(config.retry.base_delay, std::chrono::milliseconds(100));
    EXPECT_TRUE(config.compression.enabled);
    EXPECT_TRUE(config.encryption.enabled);
    EXPECT_TRUE(config.wal.enabled);
}

TEST(EngineConfigTest, FromJsonReadsCamelCaseOptions) {
    json j = {
        {"maxMemorySize", 1048576},
        {"compressionEnabled", false},
        {"encryptionEnabled", false},
        {"transactionSupport", false},
        {"retryAttempts", 3},
        {"retryDelay", 10},
        {"maintenanceInterval", 0},
        {"preferredCompression", "ZSTD"},
        {"maxBackups", 10},
    };
    EngineConfig config = EngineConfig::fromJson(j);
    EXPECT_EQ(config.max_memory_size, 1048576u);
    EXPECT_FALSE(config.compression.enabled);
    EXPECT_FALSE(config.encryption.enabled);
    EXPECT_FALSE(config.wal.enabled);
    EXPECT_EQ(config.retry.max_attempts, 3u);
    EXPECT_EQ(config.retry.base_delay, std::chrono::milliseconds(10));
    EXPECT_EQ(config.maintenance_interval.count(), 0);
    ASSERT_TRUE(config.compression.preferred_algorithm.has_value());
    EXPECT_EQ(*config.compression.preferred_algorithm, CompressionAlgorithm::ZSTD);
    EXPECT_EQ(config.backup.max_backups, 10u);
    EXPECT_EQ(config.backup.prune_count, 5u);
    EXPECT_NO_THROW(config.validate());
}

TEST(EngineConfigTest, UnknownKeysAreIgnored) {
    EXPECT_NO_THROW(EngineConfig::fromJson(json{{"somethingElse", 1}}));
}

TEST(EngineConfigTest, WrongTypesAndRangesAreRejected) {
    EXPECT_EQ(codeOf([] { EngineConfig::fromJson(json::array()); }), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(codeOf([] { EngineConfig::fromJson(json{{"compressionEnabled", "yes"}}); }),
              ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(codeOf([] { EngineConfig::fromJson(json{{"retryDelay", -1}}); }), ErrorCode::OPTION_OUT_OF_RANGE);
    EXPECT_EQ(codeOf([] { EngineConfig::fromJson(json{{"preferredCompression", "BROTLI"}}); }),
              ErrorCode::INVALID_CONFIGURATION);
}

TEST(EngineConfigTest, ValidateRejectsInconsistentOptions) {
    EXPECT_EQ(codeOf([] {
        EngineConfig c;
        c.max_memory_size = 0;
        c.validate();
    }), ErrorCode::OPTION_OUT_OF_RANGE);
    EXPECT_EQ(codeOf([] {
        EngineConfig c;
        c.retry.max_delay = std::chrono::milliseconds(10);
        c.validate();
    }), ErrorCode::OPTION_OUT_OF_RANGE);
    EXPECT_EQ(codeOf([] {
        EngineConfig c;
        c.cache.normal_fraction = 1.5;
        c.validate();
    }), ErrorCode::OPTION_OUT_OF_RANGE);
    EXPECT_EQ(codeOf([] {
        EngineConfig c;
        c.governor.exit_low_memory_pressure = 0.9;
        c.validate();
    }), ErrorCode::OPTION_OUT_OF_RANGE);
    EXPECT_EQ(codeOf([] {
        EngineConfig c;
        c.wal.trim_to_entries = c.wal.max_entries + 1;
        c.validate();
    }), ErrorCode::OPTION_OUT_OF_RANGE);
}

TEST(EngineConfigTest, HostTelemetryOptions) {
    EngineConfig config = EngineConfig::fromJson(json{{"lowBatteryPercent", 35}, {"systemTelemetry", true}});
    EXPECT_EQ(config.governor.low_battery_percent, 35);
    EXPECT_TRUE(config.governor.system_telemetry);
    EXPECT_NO_THROW(config.validate());

    EXPECT_EQ(codeOf([] {
        EngineConfig c;
        c.governor.low_battery_percent = 120;
        c.validate();
    }), ErrorCode::OPTION_OUT_OF_RANGE);
}

TEST(EngineConfigTest, ToJsonNeverCarriesTheKey) {
    EngineConfig config;
    config.encryption.key = "very secret";
    json j = config.toJson();
    EXPECT_FALSE(j.contains("encryptionKey"));
    EXPECT_EQ(j.dump().find("very secret"), std::string::npos);
    EXPECT_EQ(EngineConfig::fromJson(j).toJson(), j);
}

TEST(EngineConfigTest, EnvironmentKeyOnlyFillsEmptyKey) {
    ::setenv(EngineConfig::ENV_ENCRYPTION_KEY, "from-env", 1);

    EngineConfig empty;
    empty.applyEnvironment();
    EXPECT_EQ(empty.encryption.key, "from-env");

    EngineConfig explicit_key;
    explicit_key.encryption.key = "configured";
    explicit_key.applyEnvironment();
    EXPECT_EQ(explicit_key.encryption.key, "configured");

    ::unsetenv(EngineConfig::ENV_ENCRYPTION_KEY);
}
