// @src/cache.cpp
#include "flowstore/cache.h"
#include "flowstore/debug_utils.h"

#include <algorithm>
#include <cmath>

namespace flowstore {
namespace cache {

RecordCache::RecordCache(CacheConfig config, ClockFn clock)
    : config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
}

double RecordCache::score(const RecordMetadata& metadata, TimePoint now) {
    auto idle_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - metadata.last_accessed_at).count();
    if (idle_ms < 0) idle_ms = 0;
    return static_cast<double>(metadata.access_count) * static_cast<double>(idle_ms);
}

std::optional<Record> RecordCache::get(const std::string& key) {
    if (!config_.enabled) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        stats_.record_miss();
        return std::nullopt;
    }
    stats_.record_hit();
    it->second.metadata.access_count++;
    it->second.metadata.last_accessed_at = clock_();
    return it->second;
}

void RecordCache::put(const std::string& key, const Record& record) {
    if (!config_.enabled) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        bytes_ -= entryBytes(key, it->second);
        it->second = record;
    } else {
        it = entries_.emplace(key, record).first;
    }
    bytes_ += entryBytes(key, it->second);
}

bool RecordCache::invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    bytes_ -= entryBytes(key, it->second);
    entries_.erase(it);
    return true;
}

bool RecordCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) > 0;
}

void RecordCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    bytes_ = 0;
}

void RecordCache::setBudget(size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    budget_ = bytes;
}

std::optional<size_t> RecordCache::budget() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_;
}

size_t RecordCache::bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_;
}

size_t RecordCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t RecordCache::evictIfOverBudget(bool force) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_();
    size_t evicted = 0;
    if (force && !entries_.empty()) {
        evicted += evictRoundLocked(now);
    }
    while (budget_ && bytes_ > *budget_ && !entries_.empty()) {
        evicted += evictRoundLocked(now);
    }
    if (evicted > 0) {
        LOG_DEBUG(1, "[RecordCache] Evicted {} entries, {} bytes of {} budget remain", evicted, bytes_, budget_.value_or(0));
    }
    return evicted;
}

size_t RecordCache::evictRoundLocked(TimePoint now) {
    std::vector<std::pair<double, std::string>> ranked;
    ranked.reserve(entries_.size());
    for (const auto& [key, record] : entries_) {
        ranked.emplace_back(score(record.metadata, now), key);
    }
    // Key as tie-breaker keeps rounds deterministic.
    std::sort(ranked.begin(), ranked.end());

    size_t to_evict = static_cast<size_t>(std::floor(static_cast<double>(ranked.size()) * config_.eviction_fraction + 1e-9));
    to_evict = std::clamp<size_t>(to_evict, 1, ranked.size());

    for (size_t i = 0; i < to_evict; ++i) {
        auto it = entries_.find(ranked[i].second);
        bytes_ -= entryBytes(it->first, it->second);
        entries_.erase(it);
    }
    stats_.record_evictions(to_evict);
    return to_evict;
}

} // namespace cache
} // namespace flowstore
