// @src/config.cpp
#include "flowstore/config.h"
#include "flowstore/storage_error/exceptions.h"
#include "flowstore/storage_error/error_utils.h"
#include "flowstore/debug_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <algorithm>
#include <cstdlib>
#include <set>

namespace flowstore {

using storage::ErrorCode;

namespace {

[[noreturn]] void throwConfigError(ErrorCode code, const std::string& option, const std::string& message) {
    throw ConfigurationError(STORAGE_ERROR(code, message).withContext("option", option));
}

template<typename T>
void readOption(const json& j, const char* name, T& out) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throwConfigError(ErrorCode::INVALID_CONFIGURATION, name,
                         std::string("Option '") + name + "' has the wrong type: " + e.what());
    }
}

void readMillis(const json& j, const char* name, std::chrono::milliseconds& out) {
    int64_t ms = out.count();
    readOption(j, name, ms);
    if (ms < 0) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, name, std::string("Option '") + name + "' must not be negative");
    }
    out = std::chrono::milliseconds(ms);
}

void requireFraction(double value, const char* name, bool allow_zero) {
    if (value > 1.0 || value < 0.0 || (!allow_zero && value == 0.0)) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, name,
                         std::string("Option '") + name + "' must be within " + (allow_zero ? "[0, 1]" : "(0, 1]"));
    }
}

const std::set<std::string>& knownKeys() {
    static const std::set<std::string> keys = {
        "maxMemorySize", "maxKeyLength", "errorLogCapacity", "maintenanceInterval", "walSinkPath",
        "compressionEnabled", "compressionMinSize", "preferredCompression", "zstdLevel",
        "encryptionEnabled", "encryptionKey", "kdfIterations",
        "cacheEnabled", "cacheFraction", "lowMemoryCacheFraction", "evictionFraction",
        "transactionSupport", "walRetention", "walMaxEntries", "walTrimTo", "walLogValues",
        "retryAttempts", "retryDelay", "maxRetryDelay",
        "lowMemoryEnterPressure", "lowMemoryExitPressure", "lowMemoryMaxBytes", "batchSize", "constrainedBatchSize",
        "lowBatteryPercent", "systemTelemetry",
        "healthSelfTest", "maxErrorRate", "minCacheHitRate",
        "maxBackups", "backupRetention",
    };
    return keys;
}

} // namespace

EngineConfig EngineConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throwConfigError(ErrorCode::INVALID_CONFIGURATION, "<root>", "Engine configuration must be a JSON object");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (knownKeys().count(it.key()) == 0) {
            LOG_WARN("[EngineConfig] Ignoring unknown option '{}'", it.key());
        }
    }

    EngineConfig config;
    readOption(j, "maxMemorySize", config.max_memory_size);
    readOption(j, "maxKeyLength", config.max_key_length);
    readOption(j, "errorLogCapacity", config.error_log_capacity);
    readMillis(j, "maintenanceInterval", config.maintenance_interval);
    readOption(j, "walSinkPath", config.wal_sink_path);

    readOption(j, "compressionEnabled", config.compression.enabled);
    readOption(j, "compressionMinSize", config.compression.min_size);
    readOption(j, "zstdLevel", config.compression.zstd_level);
    if (j.contains("preferredCompression") && !j["preferredCompression"].is_null()) {
        std::string name;
        readOption(j, "preferredCompression", name);
        auto algorithm = magic_enum::enum_cast<CompressionAlgorithm>(name);
        if (!algorithm) {
            throwConfigError(ErrorCode::INVALID_CONFIGURATION, "preferredCompression",
                             "Unknown compression algorithm '" + name + "'");
        }
        config.compression.preferred_algorithm = *algorithm;
    }

    readOption(j, "encryptionEnabled", config.encryption.enabled);
    readOption(j, "encryptionKey", config.encryption.key);
    readOption(j, "kdfIterations", config.encryption.kdf_iterations);

    readOption(j, "cacheEnabled", config.cache.enabled);
    readOption(j, "cacheFraction", config.cache.normal_fraction);
    readOption(j, "lowMemoryCacheFraction", config.cache.low_memory_fraction);
    readOption(j, "evictionFraction", config.cache.eviction_fraction);

    readOption(j, "transactionSupport", config.wal.enabled);
    readMillis(j, "walRetention", config.wal.retention);
    readOption(j, "walMaxEntries", config.wal.max_entries);
    readOption(j, "walTrimTo", config.wal.trim_to_entries);
    readOption(j, "walLogValues", config.wal.log_values);

    readOption(j, "retryAttempts", config.retry.max_attempts);
    readMillis(j, "retryDelay", config.retry.base_delay);
    readMillis(j, "maxRetryDelay", config.retry.max_delay);

    readOption(j, "lowMemoryEnterPressure", config.governor.enter_low_memory_pressure);
    readOption(j, "lowMemoryExitPressure", config.governor.exit_low_memory_pressure);
    readOption(j, "lowMemoryMaxBytes", config.governor.low_memory_max_bytes);
    readOption(j, "batchSize", config.governor.normal_batch_size);
    readOption(j, "constrainedBatchSize", config.governor.constrained_batch_size);
    readOption(j, "lowBatteryPercent", config.governor.low_battery_percent);
    readOption(j, "systemTelemetry", config.governor.system_telemetry);

    readOption(j, "healthSelfTest", config.health.self_test_enabled);
    readOption(j, "maxErrorRate", config.health.max_error_rate);
    readOption(j, "minCacheHitRate", config.health.min_cache_hit_rate);

    if (j.contains("maxBackups")) {
        readOption(j, "maxBackups", config.backup.max_backups);
        config.backup.prune_count = std::max<size_t>(1, config.backup.max_backups / 2);
    }
    readMillis(j, "backupRetention", config.backup.retention);
    return config;
}

json EngineConfig::toJson() const {
    json j = {
        {"maxMemorySize", max_memory_size},
        {"maxKeyLength", max_key_length},
        {"errorLogCapacity", error_log_capacity},
        {"maintenanceInterval", maintenance_interval.count()},
        {"walSinkPath", wal_sink_path},
        {"compressionEnabled", compression.enabled},
        {"compressionMinSize", compression.min_size},
        {"zstdLevel", compression.zstd_level},
        {"encryptionEnabled", encryption.enabled},
        {"kdfIterations", encryption.kdf_iterations},
        {"cacheEnabled", cache.enabled},
        {"cacheFraction", cache.normal_fraction},
        {"lowMemoryCacheFraction", cache.low_memory_fraction},
        {"evictionFraction", cache.eviction_fraction},
        {"transactionSupport", wal.enabled},
        {"walRetention", wal.retention.count()},
        {"walMaxEntries", wal.max_entries},
        {"walTrimTo", wal.trim_to_entries},
        {"walLogValues", wal.log_values},
        {"retryAttempts", retry.max_attempts},
        {"retryDelay", retry.base_delay.count()},
        {"maxRetryDelay", retry.max_delay.count()},
        {"lowMemoryEnterPressure", governor.enter_low_memory_pressure},
        {"lowMemoryExitPressure", governor.exit_low_memory_pressure},
        {"lowMemoryMaxBytes", governor.low_memory_max_bytes},
        {"batchSize", governor.normal_batch_size},
        {"constrainedBatchSize", governor.constrained_batch_size},
        {"lowBatteryPercent", governor.low_battery_percent},
        {"systemTelemetry", governor.system_telemetry},
        {"healthSelfTest", health.self_test_enabled},
        {"maxErrorRate", health.max_error_rate},
        {"minCacheHitRate", health.min_cache_hit_rate},
        {"maxBackups", backup.max_backups},
        {"backupRetention", backup.retention.count()},
    };
    j["preferredCompression"] = compression.preferred_algorithm
        ? json(std::string(magic_enum::enum_name(*compression.preferred_algorithm)))
        : json(nullptr);
    return j;
}

EngineConfig& EngineConfig::applyEnvironment() {
    if (encryption.key.empty()) {
        const char* env_key = std::getenv(ENV_ENCRYPTION_KEY);
        if (env_key != nullptr && *env_key != '\0') {
            encryption.key = env_key;
            LOG_INFO("[EngineConfig] Encryption key taken from {}", ENV_ENCRYPTION_KEY);
        }
    }
    return *this;
}

void EngineConfig::validate() const {
    if (max_memory_size == 0) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, "maxMemorySize", "maxMemorySize must be positive");
    }
    if (max_key_length == 0) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, "maxKeyLength", "maxKeyLength must be positive");
    }
    if (error_log_capacity == 0) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, "errorLogCapacity", "errorLogCapacity must be positive");
    }
    if (retry.max_attempts == 0) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, "retryAttempts", "retryAttempts must be at least 1");
    }
    if (retry.max_delay < retry.base_delay) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, "maxRetryDelay", "maxRetryDelay must not be below retryDelay");
    }
    requireFraction(cache.normal_fraction, "cacheFraction", false);
    requireFraction(cache.low_memory_fraction, "lowMemoryCacheFraction", false);
    requireFraction(cache.eviction_fraction, "evictionFraction", false);
    requireFraction(compression.keep_ratio, "keepRatio", false);
    requireFraction(governor.enter_low_memory_pressure, "lowMemoryEnterPressure", true);
    requireFraction(governor.exit_low_memory_pressure, "lowMemoryExitPressure", true);
    if (governor.exit_low_memory_pressure > governor.enter_low_memory_pressure) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, "lowMemoryExitPressure",
                         "lowMemoryExitPressure must not exceed lowMemoryEnterPressure");
    }
    if (governor.normal_batch_size == 0 || governor.constrained_batch_size == 0) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, "batchSize", "WAL batch sizes must be positive");
    }
    if (governor.low_battery_percent < 0 || governor.low_battery_percent > 100) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, "lowBatteryPercent", "lowBatteryPercent must be within [0, 100]");
    }
    if (wal.max_entries == 0 || wal.trim_to_entries > wal.max_entries) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, "walTrimTo", "walTrimTo must not exceed a positive walMaxEntries");
    }
    if (encryption.kdf_iterations < 1) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, "kdfIterations", "kdfIterations must be at least 1");
    }
    if (backup.max_backups == 0 || backup.prune_count == 0 || backup.prune_count > backup.max_backups) {
        throwConfigError(ErrorCode::OPTION_OUT_OF_RANGE, "maxBackups",
                         "maxBackups must be positive and at least the prune count");
    }
    if (compression.simple_threshold > compression.lz77_threshold) {
        throwConfigError(ErrorCode::INVALID_CONFIGURATION, "compression", "RLE threshold must not exceed LZ77 threshold");
    }
}

} // namespace flowstore
