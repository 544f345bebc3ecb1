// @include/flowstore/config.h
#pragma once

#include "types.h"
#include "cache.h"
#include "codec.h"
#include "wal.h"
#include "backup_store.h"
#include "health_monitor.h"
#include "resource_governor.h"
#include "threading/retry_executor.h"

#include <chrono>
#include <string>

namespace flowstore {

struct EncryptionConfig {
    bool enabled = true;
    // Passphrase for the master key. Empty means a random per-process key.
    std::string key;
    int kdf_iterations = 10000;
};

/**
 * @brief Every tunable of a StorageEngine instance.
 *
 * JSON form uses camelCase keys (maxMemorySize, compressionEnabled,
 * encryptionEnabled, transactionSupport, retryAttempts, retryDelay, ...);
 * durations are in milliseconds.
 */
struct EngineConfig {
    static constexpr const char* ENV_ENCRYPTION_KEY = "FLOWSTORE_ENCRYPTION_KEY";

    size_t max_memory_size = 50 * 1024 * 1024;
    size_t max_key_length = DEFAULT_MAX_KEY_LENGTH;
    size_t error_log_capacity = 1000;
    // Period of the background maintenance pass; zero disables the thread.
    std::chrono::milliseconds maintenance_interval{std::chrono::seconds(30)};
    // When set, WAL entries are flushed to a FileWalSink at this path.
    std::string wal_sink_path;

    CompressionConfig compression;
    EncryptionConfig encryption;
    cache::CacheConfig cache;
    WalConfig wal; // wal.enabled is the transactionSupport option
    threading::RetryPolicy retry;
    GovernorConfig governor;
    HealthConfig health;
    BackupConfig backup;

    ClockFn clock; // defaults to the system clock
    threading::RetryExecutor::Sleeper retry_sleeper; // defaults to std::this_thread::sleep_for

    static EngineConfig fromJson(const json& j);
    json toJson() const; // never includes the encryption key

    // Reads FLOWSTORE_ENCRYPTION_KEY when no key was configured.
    EngineConfig& applyEnvironment();

    // Throws ConfigurationError on the first invalid option.
    void validate() const;
};

} // namespace flowstore
