// @include/flowstore/storage_engine.h
#pragma once

#include "types.h"
#include "config.h"
#include "codec.h"
#include "cache.h"
#include "record_store.h"
#include "index_manager.h"
#include "wal.h"
#include "metrics.h"
#include "backup_store.h"
#include "health_monitor.h"
#include "resource_governor.h"
#include "threading/retry_executor.h"
#include "storage_error/error_context.h"
#include "storage_error/error_handler.h"
#include "storage_error/result.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace flowstore {

/**
 * @class StorageEngine
 * @brief Embedded JSON record store with compression, encryption, caching,
 *        field indexes, and a write-ahead intent log.
 *
 * Every public operation initializes the engine on first use, runs through
 * the retry executor, and executes its body under the engine mutex. Writes
 * to the same key therefore receive versions in the order they acquire the
 * engine. Retry backoff sleeps happen with the mutex released.
 *
 * Instances are independent; nothing is process-global.
 */
class StorageEngine {
public:
    explicit StorageEngine(EngineConfig config = {},
                           std::unique_ptr<RecordStore> store = nullptr,
                           std::shared_ptr<ResourceProbe> probe = nullptr);
    ~StorageEngine();

    StorageEngine(const StorageEngine&) = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;

    // Idempotent. Starts the maintenance thread when an interval is configured.
    void init();
    // Stops maintenance and flushes the WAL sink. Later operations fail with STORAGE_SHUT_DOWN.
    void shutdown();
    bool isInitialized() const { return initialized_.load(); }

    // --- Record operations ---
    WriteResult set(const std::string& key, const json& value, const SetOptions& options = {});

    // nullopt on a miss, an invalid key, or exhausted transient failures.
    // Throws CorruptRecordError (or DecryptionError) when the record cannot be decoded.
    std::optional<json> get(const std::string& key);

    // Non-throwing read: every failure comes back as the error.
    storage::Result<std::optional<json>> tryGet(const std::string& key);

    DeleteResult remove(const std::string& key, const RemoveOptions& options = {});
    bool exists(const std::string& key);

    // Sorted keys matching a glob. Throws ScanAbortedError on timeout or cancellation.
    std::vector<std::string> keys(const std::string& pattern = "*", const KeysOptions& options = {});

    // Values whose top-level fields equal every field of `filter`, in key order.
    std::vector<json> query(const json& filter, const QueryOptions& options = {});

    std::map<std::string, std::optional<json>> mget(const std::vector<std::string>& keys);
    std::map<std::string, WriteResult> mset(const std::map<std::string, json>& values, const SetOptions& options = {});

    // expected_version 0 means the key must not exist. Throws VersionConflictError on mismatch.
    WriteResult compareAndSet(const std::string& key, uint64_t expected_version, const json& value,
                              const SetOptions& options = {});

    // --- Backups ---
    std::vector<BackupInfo> listBackups(const std::string& key);
    WriteResult restoreBackup(const std::string& backup_id);

    // --- Diagnostics and resource management ---
    std::vector<storage::StorageError> getRecentErrors(size_t count = 10) const;
    ResourcePolicy updateResourceState(const ResourceState& state);
    void runMaintenance();
    json getStats();
    HealthReport healthCheck();

    void attachWalSink(std::shared_ptr<WalSink> sink);
    void setErrorHandler(std::shared_ptr<storage::ErrorHandler> handler);

    // --- Component access (tests, diagnostics) ---
    RecordStore& getRecordStore() { return *store_; }
    cache::RecordCache& getCache() { return *cache_; }
    IndexManager& getIndexManager() { return *index_manager_; }
    WriteAheadLog& getWal() { return *wal_; }
    ResourceGovernor& getGovernor() { return *governor_; }
    BackupStore& getBackupStore() { return *backups_; }
    const Codec& getCodec() const { return *codec_; }
    const EngineMetrics& getMetrics() const { return metrics_; }
    const storage::ErrorContext& getErrorContext() const { return error_context_; }
    const EngineConfig& config() const { return config_; }
    bool isHealthy() const { return healthy_.load(); }

private:
    void ensureInitialized();
    void validateKey(const std::string& key) const;

    template<typename Fn>
    auto runOperation(const char* name, Fn&& body) -> decltype(body()) {
        ensureInitialized();
        return retry_->execute(name, [&]() {
            std::lock_guard<std::mutex> lock(engine_mutex_);
            return body();
        });
    }

    // --- Bodies; engine_mutex_ must be held ---
    WriteResult writeLocked(const std::string& key, const json& value, const SetOptions& options,
                            std::optional<uint64_t> expected_version);
    std::optional<json> readLocked(const std::string& key, TimePoint now);
    DeleteResult removeLocked(const std::string& key, const RemoveOptions& options, TimePoint now);
    std::vector<std::string> keysLocked(const std::string& pattern, const KeysOptions& options);
    // Undecodable candidates are skipped and collected into `skipped`.
    std::vector<json> queryLocked(const json& filter, const QueryOptions& options,
                                  std::vector<storage::StorageError>& skipped);

    bool isExpiredLocked(const std::string& key, TimePoint now) const;
    void purgeLocked(const std::string& key);
    size_t purgeExpiredLocked(TimePoint now);
    size_t memoryUsageLocked() const;
    void applyPolicyLocked(const ResourcePolicy& policy);
    HealthSnapshot healthSnapshotLocked() const;
    json statsLocked() const;

    // Runs the user's ErrorHandler; never call with engine_mutex_ held.
    void handleError(const storage::StorageError& error, const std::string& operation);
    void handleErrors(const std::vector<storage::StorageError>& errors, const std::string& operation);
    void maintenanceThreadLoop();

    static bool fieldMatches(const json& actual, const json& expected);

    EngineConfig config_;
    ClockFn clock_;

    std::unique_ptr<RecordStore> store_;
    std::unique_ptr<Codec> codec_;
    std::unique_ptr<cache::RecordCache> cache_;
    std::unique_ptr<IndexManager> index_manager_;
    std::unique_ptr<WriteAheadLog> wal_;
    std::unique_ptr<BackupStore> backups_;
    std::unique_ptr<ResourceGovernor> governor_;
    std::unique_ptr<HealthMonitor> health_monitor_;
    std::unique_ptr<threading::RetryExecutor> retry_;
    EngineMetrics metrics_;
    storage::ErrorContext error_context_;

    // Keys carrying a TTL, with their deadline.
    std::map<std::string, TimePoint> expiries_;

    mutable std::mutex engine_mutex_;
    std::mutex init_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shut_down_{false};
    std::atomic<bool> healthy_{true};

    std::thread maintenance_thread_;
    std::mutex maintenance_control_mutex_;
    std::condition_variable maintenance_cv_;
    std::atomic<bool> shutdown_initiated_{false};
};

} // namespace flowstore
