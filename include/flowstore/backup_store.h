// @include/flowstore/backup_store.h
#pragma once

#include "types.h"

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace flowstore {

struct BackupConfig {
    size_t max_backups = 1000;
    size_t prune_count = 500; // dropped, oldest first, once max_backups is exceeded
    std::chrono::milliseconds retention{std::chrono::hours(24)};
};

struct BackupEntry {
    BackupInfo info;
    Record record; // encoded exactly as it was in the primary store
};

/**
 * @brief Point-in-time copies of records, named backup_<key>_<millis>.
 *
 * Entries hold the encoded record, so restoring needs the same cipher key
 * that wrote it.
 */
class BackupStore {
public:
    explicit BackupStore(BackupConfig config = {});

    // Returns the new backup id.
    std::string create(const std::string& key, const Record& record, TimePoint now);

    std::optional<BackupEntry> get(const std::string& backup_id) const;
    // Newest first.
    std::vector<BackupInfo> list(const std::string& key) const;
    std::vector<BackupInfo> listAll() const;

    // Applies the count cap and the retention window. Returns entries removed.
    size_t prune(TimePoint now);

    size_t size() const;
    size_t payloadBytes() const;
    json toJson() const;

private:
    size_t enforceCapLocked();
    void eraseLocked(const std::string& backup_id);

    BackupConfig config_;
    std::unordered_map<std::string, BackupEntry> entries_;
    std::deque<std::string> order_; // creation order, oldest first
    size_t payload_bytes_ = 0;
    uint64_t created_total_ = 0;
    uint64_t pruned_total_ = 0;
    mutable std::mutex mutex_;
};

} // namespace flowstore
