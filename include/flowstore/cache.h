// @include/flowstore/cache.h
#pragma once

#include "types.h"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace flowstore {
namespace cache {

struct CacheConfig {
    bool enabled = true;
    double normal_fraction = 0.3;      // share of max memory the cache may use
    double low_memory_fraction = 0.2;  // share while the governor reports low memory
    double eviction_fraction = 0.3;    // share of entries dropped per eviction round
};

// Cache statistics
class CacheStats {
private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> eviction_rounds_{0};

public:
    CacheStats() = default;
    CacheStats(const CacheStats& other) { *this = other; }
    CacheStats& operator=(const CacheStats& other) {
        if (this == &other) {
            return *this;
        }
        hits_.store(other.hits_.load(std::memory_order_relaxed), std::memory_order_relaxed);
        misses_.store(other.misses_.load(std::memory_order_relaxed), std::memory_order_relaxed);
        evictions_.store(other.evictions_.load(std::memory_order_relaxed), std::memory_order_relaxed);
        eviction_rounds_.store(other.eviction_rounds_.load(std::memory_order_relaxed), std::memory_order_relaxed);
        return *this;
    }

    void record_hit() { hits_.fetch_add(1, std::memory_order_relaxed); }
    void record_miss() { misses_.fetch_add(1, std::memory_order_relaxed); }
    void record_evictions(uint64_t n) {
        evictions_.fetch_add(n, std::memory_order_relaxed);
        eviction_rounds_.fetch_add(1, std::memory_order_relaxed);
    }

    uint64_t get_hits() const { return hits_.load(std::memory_order_relaxed); }
    uint64_t get_misses() const { return misses_.load(std::memory_order_relaxed); }
    uint64_t get_evictions() const { return evictions_.load(std::memory_order_relaxed); }
    uint64_t get_eviction_rounds() const { return eviction_rounds_.load(std::memory_order_relaxed); }
    uint64_t get_lookups() const { return get_hits() + get_misses(); }

    double get_hit_rate() const {
        uint64_t current_hits = hits_.load(std::memory_order_relaxed);
        uint64_t total_requests = current_hits + misses_.load(std::memory_order_relaxed);
        return total_requests > 0 ? static_cast<double>(current_hits) / total_requests : 0.0;
    }

    void reset() {
        hits_.store(0, std::memory_order_relaxed);
        misses_.store(0, std::memory_order_relaxed);
        evictions_.store(0, std::memory_order_relaxed);
        eviction_rounds_.store(0, std::memory_order_relaxed);
    }
};

/**
 * @brief Size-bounded mirror of hot records.
 *
 * Entries are copies of Primary Store records at possibly older versions.
 * When the summed payload size exceeds the budget, entries are evicted in
 * rounds; each round drops the lowest-scoring eviction_fraction of entries
 * (at least one), where score = access_count * milliseconds since last access.
 * Eviction never touches the Primary Store.
 */
class RecordCache {
public:
    RecordCache(CacheConfig config, ClockFn clock);

    // A hit bumps the entry's access statistics.
    std::optional<Record> get(const std::string& key);
    void put(const std::string& key, const Record& record);
    bool invalidate(const std::string& key);
    bool contains(const std::string& key) const;
    void clear();

    // A budget of 0 keeps nothing; until a budget is set the cache is unbounded.
    void setBudget(size_t bytes);
    // Returns the number of entries evicted. force runs one round even under budget.
    size_t evictIfOverBudget(bool force = false);

    bool enabled() const { return config_.enabled; }
    std::optional<size_t> budget() const;
    size_t bytes() const;
    size_t size() const;
    const CacheConfig& config() const { return config_; }
    const CacheStats& stats() const { return stats_; }

    static double score(const RecordMetadata& metadata, TimePoint now);

private:
    size_t evictRoundLocked(TimePoint now);
    static size_t entryBytes(const std::string& key, const Record& record) {
        return key.size() + record.payload.size();
    }

    CacheConfig config_;
    ClockFn clock_;
    std::unordered_map<std::string, Record> entries_;
    size_t bytes_ = 0;
    std::optional<size_t> budget_;
    CacheStats stats_;
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace flowstore
