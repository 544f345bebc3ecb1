// @src/storage_engine.cpp
#include "flowstore/storage_engine.h"
#include "flowstore/encryption_library.h"
#include "flowstore/storage_error/exceptions.h"
#include "flowstore/storage_error/error_utils.h"
#include "flowstore/debug_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <algorithm>
#include <iterator>
#include <set>

namespace flowstore {

using storage::ErrorCode;
using storage::StorageError;

// Rough per-item bookkeeping costs folded into the memory estimate.
static constexpr size_t WAL_ENTRY_OVERHEAD_BYTES = 100;
static constexpr size_t INDEX_POSTING_OVERHEAD_BYTES = 50;

namespace {

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

// Deadline and cancellation checks shared by keys() and query().
class ScanGuard {
public:
    ScanGuard(const ScanControl& control, const char* operation)
        : control_(control), operation_(operation) {
        if (control_.timeout) {
            deadline_ = std::chrono::steady_clock::now() + *control_.timeout;
        }
        check();
    }

    void check() const {
        if (control_.cancel != nullptr && control_.cancel->load()) {
            throw ScanAbortedError(STORAGE_ERROR(ErrorCode::CANCELLED, "Scan cancelled by caller")
                                       .withContext("operation", operation_));
        }
        if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
            throw ScanAbortedError(StorageError::timeout(operation_, *control_.timeout));
        }
    }

private:
    const ScanControl& control_;
    std::string operation_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

std::shared_ptr<Cipher> buildCipher(const EncryptionConfig& config, const ClockFn& clock) {
    if (!config.enabled) {
        return nullptr;
    }
    std::string passphrase = config.key;
    if (passphrase.empty()) {
        auto random = EncryptionLibrary::generateRandomBytes(32);
        passphrase = hex_dump_string(std::string(random.begin(), random.end()));
        LOG_WARN("[StorageEngine] No encryption key configured (set {}); using an ephemeral key. "
                 "Encrypted records will not be readable by another instance.",
                 EngineConfig::ENV_ENCRYPTION_KEY);
    }
    return makeAesGcmCipher(passphrase, config.kdf_iterations, clock);
}

} // namespace

// --- Construction and lifecycle ---

StorageEngine::StorageEngine(EngineConfig config,
                             std::unique_ptr<RecordStore> store,
                             std::shared_ptr<ResourceProbe> probe)
    : config_(std::move(config)),
      error_context_(config_.error_log_capacity) {
    config_.applyEnvironment();
    config_.validate();

    clock_ = config_.clock ? config_.clock : ClockFn([] { return Clock::now(); });

    store_ = store ? std::move(store) : std::make_unique<InMemoryRecordStore>();
    codec_ = std::make_unique<Codec>(config_.compression, buildCipher(config_.encryption, clock_));
    cache_ = std::make_unique<cache::RecordCache>(config_.cache, clock_);
    index_manager_ = std::make_unique<IndexManager>();
    wal_ = std::make_unique<WriteAheadLog>(config_.wal, clock_);
    backups_ = std::make_unique<BackupStore>(config_.backup);
    if (!probe && config_.governor.system_telemetry) {
        probe = std::make_shared<SystemResourceProbe>(config_.governor);
    }
    governor_ = std::make_unique<ResourceGovernor>(config_.governor, config_.cache, config_.max_memory_size, std::move(probe));
    health_monitor_ = std::make_unique<HealthMonitor>(config_.health, this);

    retry_ = std::make_unique<threading::RetryExecutor>(config_.retry, config_.retry_sleeper);
    retry_->setRetryObserver([this](const std::string&, size_t, const std::exception&) {
        metrics_.recordRetry();
    });

    cache_->setBudget(governor_->currentPolicy().cache_budget);
}

StorageEngine::~StorageEngine() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        LOG_ERROR("[StorageEngine] Exception during shutdown: {}", e.what());
    }
}

void StorageEngine::init() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (shut_down_.load()) {
        throw StorageException(STORAGE_ERROR(ErrorCode::STORAGE_SHUT_DOWN, "Engine has been shut down"));
    }
    if (initialized_.load()) {
        return;
    }

    LOG_INFO("[StorageEngine] Initializing. Max memory: {} bytes, compression: {}, encryption: {}, WAL: {}",
             config_.max_memory_size, config_.compression.enabled, codec_->hasCipher(), config_.wal.enabled);

    if (!config_.wal_sink_path.empty()) {
        wal_->attachSink(std::make_shared<FileWalSink>(config_.wal_sink_path));
    }

    {
        std::lock_guard<std::mutex> engine_lock(engine_mutex_);
        ResourceState state = governor_->sampleEnvironment();
        applyPolicyLocked(governor_->applyPolicy(state, memoryUsageLocked()));
    }

    shutdown_initiated_.store(false);
    if (config_.maintenance_interval.count() > 0) {
        maintenance_thread_ = std::thread(&StorageEngine::maintenanceThreadLoop, this);
    }
    initialized_.store(true);
    LOG_INFO("[StorageEngine] Initialized.");
}

void StorageEngine::shutdown() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (shut_down_.exchange(true)) {
        return;
    }
    if (!initialized_.load()) {
        return;
    }
    LOG_INFO("[StorageEngine] Shutting down...");

    shutdown_initiated_.store(true);
    {
        std::unique_lock<std::mutex> control_lock(maintenance_control_mutex_);
        maintenance_cv_.notify_one();
    }
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
        LOG_INFO("  - Maintenance thread joined.");
    }

    std::lock_guard<std::mutex> engine_lock(engine_mutex_);
    if (wal_->hasSink()) {
        storage::Status flushed = wal_->flushToSink(governor_->currentPolicy().wal_batch_size);
        if (!flushed.isOk()) {
            LOG_ERROR("  - Final WAL flush failed: {}", flushed.error().toString());
        }
    }
    initialized_.store(false);
    LOG_INFO("[StorageEngine] Shutdown complete.");
}

void StorageEngine::ensureInitialized() {
    if (shut_down_.load()) {
        throw StorageException(STORAGE_ERROR(ErrorCode::STORAGE_SHUT_DOWN, "Engine has been shut down"));
    }
    if (!initialized_.load()) {
        init();
    }
}

void StorageEngine::validateKey(const std::string& key) const {
    if (key.empty()) {
        throw InvalidKeyError(StorageError::invalidKey(key, "Key must be a non-empty string"));
    }
    if (key.size() > config_.max_key_length) {
        throw InvalidKeyError(StorageError::invalidKey(
            key.substr(0, 32) + "...", "Key too long: maximum " + std::to_string(config_.max_key_length) + " characters"));
    }
}

void StorageEngine::handleError(const StorageError& error, const std::string& operation) {
    metrics_.recordError();
    StorageError recorded = error;
    recorded.withContext("operation", operation).withTimestamp(clock_());
    error_context_.reportError(recorded);
    if (storage::error_utils::isCritical(error.code) || storage::error_utils::isCorruption(error.code)) {
        LOG_ERROR("[StorageEngine] {} failed.\n{}", operation, recorded.toDetailedString());
    } else {
        LOG_DEBUG(1, "[StorageEngine] {} failed: {}", operation, error.toString());
    }
}

void StorageEngine::handleErrors(const std::vector<StorageError>& errors, const std::string& operation) {
    for (const auto& error : errors) {
        handleError(error, operation);
    }
}

// --- Record operations ---

WriteResult StorageEngine::set(const std::string& key, const json& value, const SetOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    try {
        validateKey(key);
        WriteResult result = runOperation("set", [&] { return writeLocked(key, value, options, std::nullopt); });
        result.duration_ms = elapsedMs(start);
        metrics_.recordOperation(OperationKind::WRITE, result.duration_ms);
        return result;
    } catch (const StorageException& e) {
        metrics_.recordOperation(OperationKind::WRITE, elapsedMs(start), /*failed=*/true);
        handleError(e.error(), "set");
        throw;
    } catch (const std::exception& e) {
        metrics_.recordOperation(OperationKind::WRITE, elapsedMs(start), /*failed=*/true);
        handleError(STORAGE_ERROR_WITH_DETAILS(ErrorCode::INTERNAL_ERROR, "set failed", e.what()).withContext("key", key), "set");
        throw;
    }
}

WriteResult StorageEngine::compareAndSet(const std::string& key, uint64_t expected_version, const json& value,
                                         const SetOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    try {
        validateKey(key);
        WriteResult result = runOperation("compareAndSet", [&] {
            return writeLocked(key, value, options, expected_version);
        });
        result.duration_ms = elapsedMs(start);
        metrics_.recordOperation(OperationKind::WRITE, result.duration_ms);
        return result;
    } catch (const StorageException& e) {
        metrics_.recordOperation(OperationKind::WRITE, elapsedMs(start), /*failed=*/true);
        handleError(e.error(), "compareAndSet");
        throw;
    } catch (const std::exception& e) {
        metrics_.recordOperation(OperationKind::WRITE, elapsedMs(start), /*failed=*/true);
        handleError(STORAGE_ERROR_WITH_DETAILS(ErrorCode::INTERNAL_ERROR, "compareAndSet failed", e.what()), "compareAndSet");
        throw;
    }
}

WriteResult StorageEngine::writeLocked(const std::string& key, const json& value, const SetOptions& options,
                                       std::optional<uint64_t> expected_version) {
    const TimePoint now = clock_();
    if (options.ttl && options.ttl->count() <= 0) {
        throw StorageException(STORAGE_ERROR(ErrorCode::INVALID_VALUE, "TTL must be positive").withContext("key", key));
    }

    std::optional<Record> existing = store_->get(key);
    if (existing && existing->isExpired(now)) {
        purgeLocked(key);
        existing.reset();
    }

    if (expected_version) {
        uint64_t actual = existing ? existing->metadata.version : 0;
        if (actual != *expected_version) {
            throw VersionConflictError(StorageError::versionConflict(key, *expected_version, actual));
        }
    }

    const ResourcePolicy policy = governor_->currentPolicy();
    const bool compress = options.compress.value_or(config_.compression.enabled);
    const bool encrypt = options.encrypt.value_or(codec_->hasCipher());
    EncodedValue encoded = codec_->encode(value, compress, encrypt, policy.compression);

    Record record;
    record.payload = std::move(encoded.payload);
    record.metadata = encoded.metadata;
    record.metadata.created_at = existing ? existing->metadata.created_at : now;
    record.metadata.updated_at = now;
    record.metadata.version = existing ? existing->metadata.version + 1 : 1;
    record.metadata.access_count = 0;
    record.metadata.last_accessed_at = now;
    if (options.ttl) {
        record.metadata.expires_at = now + *options.ttl;
    }

    if (config_.wal.enabled) {
        wal_->append(WalOperation::SET, key, &value);
    }
    store_->put(key, record);

    if (record.metadata.expires_at) {
        expiries_[key] = *record.metadata.expires_at;
    } else {
        expiries_.erase(key);
    }
    cache_->put(key, record);
    cache_->evictIfOverBudget();
    index_manager_->indexOnWrite(key, value);

    if (options.backup) {
        backups_->create(key, record, now);
    }

    WriteResult result;
    result.key = key;
    result.size = record.metadata.size;
    result.compressed = record.metadata.compressed;
    result.encrypted = record.metadata.encrypted;
    result.algorithm = record.metadata.algorithm;
    result.version = record.metadata.version;
    LOG_TRACE("[StorageEngine::set] key={} version={} size={} algorithm={}", format_key_for_print(key),
              result.version, result.size, magic_enum::enum_name(result.algorithm));
    return result;
}

std::optional<json> StorageEngine::get(const std::string& key) {
    const auto start = std::chrono::steady_clock::now();
    try {
        validateKey(key);
        auto value = runOperation("get", [&] { return readLocked(key, clock_()); });
        metrics_.recordOperation(OperationKind::READ, elapsedMs(start));
        return value;
    } catch (const CorruptRecordError& e) {
        metrics_.recordOperation(OperationKind::READ, elapsedMs(start), /*failed=*/true);
        handleError(e.error(), "get");
        throw;
    } catch (const StorageException& e) {
        metrics_.recordOperation(OperationKind::READ, elapsedMs(start), /*failed=*/true);
        handleError(e.error(), "get");
        return std::nullopt;
    } catch (const std::exception& e) {
        metrics_.recordOperation(OperationKind::READ, elapsedMs(start), /*failed=*/true);
        handleError(STORAGE_ERROR_WITH_DETAILS(ErrorCode::INTERNAL_ERROR, "get failed", e.what()), "get");
        return std::nullopt;
    }
}

storage::Result<std::optional<json>> StorageEngine::tryGet(const std::string& key) {
    const auto start = std::chrono::steady_clock::now();
    try {
        validateKey(key);
        auto value = runOperation("tryGet", [&] { return readLocked(key, clock_()); });
        metrics_.recordOperation(OperationKind::READ, elapsedMs(start));
        return value;
    } catch (const StorageException& e) {
        metrics_.recordOperation(OperationKind::READ, elapsedMs(start), /*failed=*/true);
        handleError(e.error(), "tryGet");
        return storage::Result<std::optional<json>>(e.error());
    } catch (const std::exception& e) {
        metrics_.recordOperation(OperationKind::READ, elapsedMs(start), /*failed=*/true);
        StorageError error = STORAGE_ERROR_WITH_DETAILS(ErrorCode::INTERNAL_ERROR, "tryGet failed", e.what());
        handleError(error, "tryGet");
        return storage::Result<std::optional<json>>(error);
    }
}

std::optional<json> StorageEngine::readLocked(const std::string& key, TimePoint now) {
    if (isExpiredLocked(key, now)) {
        purgeLocked(key);
        metrics_.recordExpired();
        return std::nullopt;
    }

    if (auto cached = cache_->get(key)) {
        metrics_.recordCacheHit();
        store_->touch(key, now);
        return codec_->decode(cached->payload, cached->metadata);
    }

    if (cache_->enabled()) {
        metrics_.recordCacheMiss();
    }
    std::optional<Record> record = store_->get(key);
    if (!record) {
        return std::nullopt;
    }
    store_->touch(key, now);
    record->metadata.access_count++;
    record->metadata.last_accessed_at = now;

    json value = codec_->decode(record->payload, record->metadata);
    cache_->put(key, *record);
    cache_->evictIfOverBudget();
    return value;
}

DeleteResult StorageEngine::remove(const std::string& key, const RemoveOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    try {
        validateKey(key);
        DeleteResult result = runOperation("remove", [&] { return removeLocked(key, options, clock_()); });
        metrics_.recordOperation(OperationKind::DELETE, elapsedMs(start));
        return result;
    } catch (const StorageException& e) {
        metrics_.recordOperation(OperationKind::DELETE, elapsedMs(start), /*failed=*/true);
        handleError(e.error(), "remove");
        throw;
    } catch (const std::exception& e) {
        metrics_.recordOperation(OperationKind::DELETE, elapsedMs(start), /*failed=*/true);
        handleError(STORAGE_ERROR_WITH_DETAILS(ErrorCode::INTERNAL_ERROR, "remove failed", e.what()), "remove");
        throw;
    }
}

DeleteResult StorageEngine::removeLocked(const std::string& key, const RemoveOptions& options, TimePoint now) {
    DeleteResult result;
    result.key = key;

    std::optional<Record> existing = store_->get(key);
    if (!existing) {
        // Nothing stored; drop any leftovers so the mirrors cannot disagree.
        cache_->invalidate(key);
        index_manager_->removeFromIndex(key);
        expiries_.erase(key);
        return result;
    }
    if (existing->isExpired(now)) {
        purgeLocked(key);
        metrics_.recordExpired();
        return result;
    }

    if (options.backup) {
        backups_->create(key, *existing, now);
    }
    if (config_.wal.enabled) {
        wal_->append(WalOperation::DELETE, key, nullptr);
    }
    store_->remove(key);
    cache_->invalidate(key);
    index_manager_->removeFromIndex(key);
    expiries_.erase(key);

    result.existed = true;
    return result;
}

bool StorageEngine::exists(const std::string& key) {
    const auto start = std::chrono::steady_clock::now();
    try {
        validateKey(key);
        bool found = runOperation("exists", [&] {
            const TimePoint now = clock_();
            if (isExpiredLocked(key, now)) {
                purgeLocked(key);
                metrics_.recordExpired();
                return false;
            }
            return store_->contains(key);
        });
        metrics_.recordOperation(OperationKind::READ, elapsedMs(start));
        return found;
    } catch (const StorageException& e) {
        metrics_.recordOperation(OperationKind::READ, elapsedMs(start), /*failed=*/true);
        handleError(e.error(), "exists");
        return false;
    } catch (const std::exception& e) {
        metrics_.recordOperation(OperationKind::READ, elapsedMs(start), /*failed=*/true);
        handleError(STORAGE_ERROR_WITH_DETAILS(ErrorCode::INTERNAL_ERROR, "exists failed", e.what()), "exists");
        return false;
    }
}

std::vector<std::string> StorageEngine::keys(const std::string& pattern, const KeysOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    try {
        auto result = runOperation("keys", [&] { return keysLocked(pattern, options); });
        metrics_.recordOperation(OperationKind::QUERY, elapsedMs(start));
        return result;
    } catch (const ScanAbortedError& e) {
        metrics_.recordOperation(OperationKind::QUERY, elapsedMs(start), /*failed=*/true);
        handleError(e.error(), "keys");
        throw;
    } catch (const StorageException& e) {
        metrics_.recordOperation(OperationKind::QUERY, elapsedMs(start), /*failed=*/true);
        handleError(e.error(), "keys");
        return {};
    } catch (const std::exception& e) {
        metrics_.recordOperation(OperationKind::QUERY, elapsedMs(start), /*failed=*/true);
        handleError(STORAGE_ERROR_WITH_DETAILS(ErrorCode::INTERNAL_ERROR, "keys failed", e.what()), "keys");
        return {};
    }
}

std::vector<std::string> StorageEngine::keysLocked(const std::string& pattern, const KeysOptions& options) {
    ScanGuard guard(options.control, "keys");
    const TimePoint now = clock_();

    std::vector<std::string> matched = store_->scanKeys(pattern);
    std::vector<std::string> result;
    size_t skipped = 0;
    for (size_t i = 0; i < matched.size(); ++i) {
        if ((i & 0xFF) == 0) guard.check();
        const std::string& key = matched[i];
        if (isExpiredLocked(key, now)) {
            continue;
        }
        if (skipped < options.offset) {
            ++skipped;
            continue;
        }
        if (options.limit && result.size() >= *options.limit) {
            break;
        }
        result.push_back(key);
    }
    guard.check();
    return result;
}

std::vector<json> StorageEngine::query(const json& filter, const QueryOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    std::vector<StorageError> skipped;
    try {
        if (!filter.is_object()) {
            throw StorageException(STORAGE_ERROR(ErrorCode::INVALID_VALUE, "Query filter must be a JSON object"));
        }
        auto result = runOperation("query", [&] {
            skipped.clear();
            return queryLocked(filter, options, skipped);
        });
        metrics_.recordOperation(OperationKind::QUERY, elapsedMs(start));
        handleErrors(skipped, "query");
        return result;
    } catch (const StorageException& e) {
        metrics_.recordOperation(OperationKind::QUERY, elapsedMs(start), /*failed=*/true);
        handleErrors(skipped, "query");
        handleError(e.error(), "query");
        throw;
    } catch (const std::exception& e) {
        metrics_.recordOperation(OperationKind::QUERY, elapsedMs(start), /*failed=*/true);
        handleErrors(skipped, "query");
        handleError(STORAGE_ERROR_WITH_DETAILS(ErrorCode::INTERNAL_ERROR, "query failed", e.what()), "query");
        throw;
    }
}

bool StorageEngine::fieldMatches(const json& actual, const json& expected) {
    if (actual.is_number() && expected.is_number()) {
        return IndexManager::encodeValue(actual) == IndexManager::encodeValue(expected);
    }
    return actual == expected;
}

std::vector<json> StorageEngine::queryLocked(const json& filter, const QueryOptions& options,
                                            std::vector<StorageError>& skipped) {
    ScanGuard guard(options.control, "query");
    const TimePoint now = clock_();

    // Intersect the posting sets of every field the index can answer.
    std::optional<std::set<std::string>> candidates;
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        if (!IndexManager::isIndexable(it.value())) continue;
        auto postings = index_manager_->findByField(it.key(), it.value());
        if (!postings) continue;
        if (!candidates) {
            candidates = std::move(*postings);
        } else {
            std::set<std::string> narrowed;
            std::set_intersection(candidates->begin(), candidates->end(), postings->begin(), postings->end(),
                                  std::inserter(narrowed, narrowed.end()));
            candidates = std::move(narrowed);
        }
        if (candidates->empty()) break;
    }

    std::vector<std::string> ordered;
    if (candidates) {
        std::regex compiled = globToRegex(options.key_pattern);
        for (const auto& key : *candidates) {
            if (globMatch(compiled, key)) ordered.push_back(key);
        }
    } else {
        LOG_DEBUG(1, "[StorageEngine::query] No indexed field in filter, scanning '{}'", options.key_pattern);
        ordered = store_->scanKeys(options.key_pattern);
    }

    std::vector<json> results;
    for (size_t i = 0; i < ordered.size(); ++i) {
        if ((i & 0x3F) == 0) guard.check();
        if (options.limit && results.size() >= *options.limit) break;

        const std::string& key = ordered[i];
        std::optional<json> value;
        try {
            value = readLocked(key, now);
        } catch (const CorruptRecordError& e) {
            skipped.push_back(e.error());
            continue;
        }
        if (!value || !value->is_object()) continue;

        bool matches = true;
        for (auto it = filter.begin(); it != filter.end() && matches; ++it) {
            auto field = value->find(it.key());
            matches = field != value->end() && fieldMatches(*field, it.value());
        }
        if (matches) {
            results.push_back(std::move(*value));
        }
    }
    guard.check();
    return results;
}

std::map<std::string, std::optional<json>> StorageEngine::mget(const std::vector<std::string>& keys) {
    std::map<std::string, std::optional<json>> result;
    for (const auto& key : keys) {
        auto read = tryGet(key);
        result[key] = read.isOk() ? read.value() : std::optional<json>{};
    }
    return result;
}

std::map<std::string, WriteResult> StorageEngine::mset(const std::map<std::string, json>& values,
                                                       const SetOptions& options) {
    std::map<std::string, WriteResult> result;
    for (const auto& [key, value] : values) {
        result.emplace(key, set(key, value, options));
    }
    return result;
}

// --- Backups ---

std::vector<BackupInfo> StorageEngine::listBackups(const std::string& key) {
    ensureInitialized();
    return backups_->list(key);
}

WriteResult StorageEngine::restoreBackup(const std::string& backup_id) {
    const auto start = std::chrono::steady_clock::now();
    try {
        WriteResult result = runOperation("restoreBackup", [&] {
            auto entry = backups_->get(backup_id);
            if (!entry) {
                throw StorageException(STORAGE_ERROR(ErrorCode::BACKUP_NOT_FOUND, "No such backup")
                                           .withContext("backup_id", backup_id));
            }
            json value = codec_->decode(entry->record.payload, entry->record.metadata);
            LOG_INFO("[StorageEngine] Restoring {} from {}", format_key_for_print(entry->info.original_key), backup_id);
            return writeLocked(entry->info.original_key, value, SetOptions{}, std::nullopt);
        });
        result.duration_ms = elapsedMs(start);
        metrics_.recordOperation(OperationKind::WRITE, result.duration_ms);
        return result;
    } catch (const StorageException& e) {
        metrics_.recordOperation(OperationKind::WRITE, elapsedMs(start), /*failed=*/true);
        handleError(e.error(), "restoreBackup");
        throw;
    } catch (const std::exception& e) {
        metrics_.recordOperation(OperationKind::WRITE, elapsedMs(start), /*failed=*/true);
        handleError(STORAGE_ERROR_WITH_DETAILS(ErrorCode::INTERNAL_ERROR, "restoreBackup failed", e.what()), "restoreBackup");
        throw;
    }
}

// --- Expiry ---

bool StorageEngine::isExpiredLocked(const std::string& key, TimePoint now) const {
    auto it = expiries_.find(key);
    return it != expiries_.end() && now >= it->second;
}

void StorageEngine::purgeLocked(const std::string& key) {
    if (config_.wal.enabled && store_->contains(key)) {
        wal_->append(WalOperation::DELETE, key, nullptr);
    }
    store_->remove(key);
    cache_->invalidate(key);
    index_manager_->removeFromIndex(key);
    expiries_.erase(key);
}

size_t StorageEngine::purgeExpiredLocked(TimePoint now) {
    std::vector<std::string> expired;
    for (const auto& [key, deadline] : expiries_) {
        if (now >= deadline) expired.push_back(key);
    }
    for (const auto& key : expired) {
        purgeLocked(key);
    }
    if (!expired.empty()) {
        metrics_.recordExpired(expired.size());
        LOG_DEBUG(1, "[StorageEngine] Purged {} expired records", expired.size());
    }
    return expired.size();
}

// --- Resources, maintenance, health ---

size_t StorageEngine::memoryUsageLocked() const {
    return store_->payloadBytes() +
           cache_->bytes() +
           wal_->size() * WAL_ENTRY_OVERHEAD_BYTES +
           index_manager_->postingCount() * INDEX_POSTING_OVERHEAD_BYTES +
           backups_->payloadBytes();
}

void StorageEngine::applyPolicyLocked(const ResourcePolicy& policy) {
    cache_->setBudget(policy.cache_budget);
    cache_->evictIfOverBudget();
}

ResourcePolicy StorageEngine::updateResourceState(const ResourceState& state) {
    ensureInitialized();
    std::lock_guard<std::mutex> lock(engine_mutex_);
    ResourcePolicy policy = governor_->applyPolicy(state, memoryUsageLocked());
    applyPolicyLocked(policy);
    return policy;
}

void StorageEngine::runMaintenance() {
    ensureInitialized();
    std::optional<StorageError> flush_error;
    {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        const TimePoint now = clock_();

        ResourceState state = governor_->sampleEnvironment();
        ResourcePolicy policy = governor_->applyPolicy(state, memoryUsageLocked());
        applyPolicyLocked(policy);

        if (wal_->hasSink()) {
            storage::Status flushed = wal_->flushToSink(policy.wal_batch_size);
            if (!flushed.isOk()) {
                flush_error = flushed.error();
            }
        }
        size_t wal_pruned = wal_->prune(now);
        size_t expired = purgeExpiredLocked(now);
        size_t index_removed = index_manager_->garbageCollect([this](const std::string& key) {
            return store_->contains(key);
        });
        size_t backups_pruned = backups_->prune(now);

        LOG_DEBUG(1, "[StorageEngine] Maintenance: wal_pruned={} expired={} index_removed={} backups_pruned={}",
                  wal_pruned, expired, index_removed, backups_pruned);
    }
    if (flush_error) {
        handleError(*flush_error, "maintenance");
    }
    healthCheck();
}

void StorageEngine::maintenanceThreadLoop() {
    LOG_INFO("[MaintenanceThread] Started. Interval: {}ms", config_.maintenance_interval.count());
    while (!shutdown_initiated_.load()) {
        {
            std::unique_lock<std::mutex> lock(maintenance_control_mutex_);
            if (maintenance_cv_.wait_for(lock, config_.maintenance_interval, [this] {
                return shutdown_initiated_.load();
            })) {
                break;
            }
        }
        if (shutdown_initiated_.load()) break;

        try {
            runMaintenance();
        } catch (const std::exception& e) {
            LOG_ERROR("[MaintenanceThread] Exception during maintenance pass: {}", e.what());
        }
    }
    LOG_INFO("[MaintenanceThread] Stopped.");
}

HealthSnapshot StorageEngine::healthSnapshotLocked() const {
    HealthSnapshot snapshot;
    snapshot.error_rate = metrics_.errorRate();
    snapshot.cache_hit_rate = metrics_.cacheHitRate();
    snapshot.cache_lookups = metrics_.cacheLookups();
    snapshot.memory_usage = memoryUsageLocked();
    snapshot.memory_budget = governor_->currentPolicy().effective_max_memory;
    return snapshot;
}

HealthReport StorageEngine::healthCheck() {
    ensureInitialized();
    HealthSnapshot snapshot;
    json stats;
    {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        snapshot = healthSnapshotLocked();
        stats = statsLocked();
    }

    // The self-test goes through the public operations, so no lock is held here.
    HealthReport report = health_monitor_->buildReport(clock_(), snapshot, std::move(stats));

    if (report.memory_pressure_detected) {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        applyPolicyLocked(governor_->forceLowMemory());
    }
    healthy_.store(report.healthy);
    return report;
}

json StorageEngine::getStats() {
    ensureInitialized();
    std::lock_guard<std::mutex> lock(engine_mutex_);
    return statsLocked();
}

json StorageEngine::statsLocked() const {
    const auto& cache_stats = cache_->stats();
    const Cipher* cipher = codec_->cipher();

    json health = {
        {"healthy", healthy_.load()},
        {"checksRun", health_monitor_->checksRun()},
        {"failedChecks", health_monitor_->failedChecks()},
        {"totalErrors", error_context_.getTotalErrorCount()},
        {"loggedErrors", error_context_.size()},
    };
    if (auto last = health_monitor_->lastReport()) {
        health["lastCheck"] = to_epoch_millis(last->timestamp);
        health["lastIssues"] = last->issues;
    }

    return {
        {"storage", {
            {"records", store_->size()},
            {"payloadBytes", store_->payloadBytes()},
            {"memoryUsage", memoryUsageLocked()},
            {"maxMemorySize", config_.max_memory_size},
            {"expiringRecords", expiries_.size()},
            {"wal", wal_->toJson()},
            {"indexes", index_manager_->toJson()},
            {"backups", backups_->toJson()},
        }},
        {"performance", metrics_.performanceJson()},
        {"operations", metrics_.operationsJson()},
        {"cache", {
            {"enabled", cache_->enabled()},
            {"entries", cache_->size()},
            {"bytes", cache_->bytes()},
            {"budget", cache_->budget() ? json(*cache_->budget()) : json(nullptr)},
            {"hits", cache_stats.get_hits()},
            {"misses", cache_stats.get_misses()},
            {"evictions", cache_stats.get_evictions()},
            {"hitRate", cache_stats.get_hit_rate()},
        }},
        {"compression", codec_->stats().toJson()},
        {"encryption", {
            {"enabled", cipher != nullptr},
            {"scheme", std::string(magic_enum::enum_name(cipher ? cipher->scheme() : EncryptionScheme::NONE))},
            {"encryptions", codec_->stats().get_encryptions()},
            {"decryptions", codec_->stats().get_decryptions()},
            {"keyRotations", cipher ? cipher->keyRotations() : 0},
        }},
        {"resources", governor_->toJson()},
        {"health", health},
        {"config", config_.toJson()},
    };
}

// --- Misc ---

std::vector<StorageError> StorageEngine::getRecentErrors(size_t count) const {
    return error_context_.getRecentErrors(count);
}

void StorageEngine::attachWalSink(std::shared_ptr<WalSink> sink) {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    wal_->attachSink(std::move(sink));
}

void StorageEngine::setErrorHandler(std::shared_ptr<storage::ErrorHandler> handler) {
    error_context_.setErrorHandler(std::move(handler));
}

} // namespace flowstore
