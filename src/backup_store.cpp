// @src/backup_store.cpp
#include "flowstore/backup_store.h"
#include "flowstore/debug_utils.h"

#include <algorithm>

namespace flowstore {

BackupStore::BackupStore(BackupConfig config) : config_(config) {
    if (config_.prune_count == 0) config_.prune_count = 1;
}

std::string BackupStore::create(const std::string& key, const Record& record, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string base = "backup_" + key + "_" + std::to_string(to_epoch_millis(now));
    std::string backup_id = base;
    for (int suffix = 2; entries_.count(backup_id) > 0; ++suffix) {
        backup_id = base + "_" + std::to_string(suffix);
    }

    BackupEntry entry;
    entry.info.backup_id = backup_id;
    entry.info.original_key = key;
    entry.info.created_at = now;
    entry.info.version = record.metadata.version;
    entry.record = record;

    payload_bytes_ += backup_id.size() + record.payload.size();
    entries_.emplace(backup_id, std::move(entry));
    order_.push_back(backup_id);
    ++created_total_;

    LOG_DEBUG(1, "[BackupStore] Created {} (version {})", backup_id, record.metadata.version);
    enforceCapLocked();
    return backup_id;
}

std::optional<BackupEntry> BackupStore::get(const std::string& backup_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(backup_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<BackupInfo> BackupStore::list(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BackupInfo> result;
    for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
        const auto& info = entries_.at(*it).info;
        if (info.original_key == key) {
            result.push_back(info);
        }
    }
    return result;
}

std::vector<BackupInfo> BackupStore::listAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BackupInfo> result;
    result.reserve(order_.size());
    for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
        result.push_back(entries_.at(*it).info);
    }
    return result;
}

size_t BackupStore::prune(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = enforceCapLocked();

    const TimePoint cutoff = now - config_.retention;
    size_t expired = 0;
    while (!order_.empty() && entries_.at(order_.front()).info.created_at < cutoff) {
        eraseLocked(order_.front());
        order_.pop_front();
        ++expired;
    }
    pruned_total_ += expired;
    removed += expired;
    if (removed > 0) {
        LOG_DEBUG(1, "[BackupStore] Pruned {} backups, {} remain", removed, order_.size());
    }
    return removed;
}

size_t BackupStore::enforceCapLocked() {
    if (order_.size() <= config_.max_backups) {
        return 0;
    }
    size_t to_drop = std::min(config_.prune_count, order_.size());
    for (size_t i = 0; i < to_drop; ++i) {
        eraseLocked(order_.front());
        order_.pop_front();
    }
    pruned_total_ += to_drop;
    LOG_INFO("[BackupStore] Backup count exceeded {}, dropped the {} oldest", config_.max_backups, to_drop);
    return to_drop;
}

void BackupStore::eraseLocked(const std::string& backup_id) {
    auto it = entries_.find(backup_id);
    if (it == entries_.end()) return;
    payload_bytes_ -= backup_id.size() + it->second.record.payload.size();
    entries_.erase(it);
}

size_t BackupStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t BackupStore::payloadBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return payload_bytes_;
}

json BackupStore::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"count", entries_.size()},
        {"bytes", payload_bytes_},
        {"created", created_total_},
        {"pruned", pruned_total_},
        {"maxBackups", config_.max_backups},
    };
}

} // namespace flowstore
