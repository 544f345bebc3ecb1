// @include/flowstore/metrics.h
#pragma once

#include "types.h"

#include <atomic>
#include <mutex>

namespace flowstore {

enum class OperationKind : uint8_t {
    READ,
    WRITE,
    DELETE,
    QUERY,
};

// Running mean of operation latencies.
struct LatencyAverage {
    uint64_t samples = 0;
    double average_ms = 0.0;
    double max_ms = 0.0;

    void add(double ms) {
        ++samples;
        average_ms += (ms - average_ms) / static_cast<double>(samples);
        if (ms > max_ms) max_ms = ms;
    }
};

/**
 * @brief Engine-wide operation counters.
 *
 * Counters are lock-free; the latency averages share one small mutex.
 */
class EngineMetrics {
public:
    void recordOperation(OperationKind kind, double duration_ms, bool failed = false);
    void recordCacheHit() { cache_hits_.fetch_add(1, std::memory_order_relaxed); }
    void recordCacheMiss() { cache_misses_.fetch_add(1, std::memory_order_relaxed); }
    void recordError() { errors_.fetch_add(1, std::memory_order_relaxed); }
    void recordRetry() { retries_.fetch_add(1, std::memory_order_relaxed); }
    void recordExpired(uint64_t n = 1) { expired_.fetch_add(n, std::memory_order_relaxed); }

    uint64_t reads() const { return reads_.load(std::memory_order_relaxed); }
    uint64_t writes() const { return writes_.load(std::memory_order_relaxed); }
    uint64_t deletes() const { return deletes_.load(std::memory_order_relaxed); }
    uint64_t queries() const { return queries_.load(std::memory_order_relaxed); }
    uint64_t cacheHits() const { return cache_hits_.load(std::memory_order_relaxed); }
    uint64_t cacheMisses() const { return cache_misses_.load(std::memory_order_relaxed); }
    // Every reported error, including per-record errors inside one query.
    uint64_t errors() const { return errors_.load(std::memory_order_relaxed); }
    uint64_t failedOperations() const { return failed_operations_.load(std::memory_order_relaxed); }
    uint64_t retries() const { return retries_.load(std::memory_order_relaxed); }
    uint64_t expired() const { return expired_.load(std::memory_order_relaxed); }

    uint64_t totalOperations() const { return reads() + writes() + deletes() + queries(); }
    // failed operations / operations, so never above 1; 0 when nothing has run.
    double errorRate() const;
    double cacheHitRate() const;
    uint64_t cacheLookups() const { return cacheHits() + cacheMisses(); }

    LatencyAverage latency(OperationKind kind) const;

    json operationsJson() const;
    json performanceJson() const;

private:
    std::atomic<uint64_t> reads_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> deletes_{0};
    std::atomic<uint64_t> queries_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> cache_misses_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<uint64_t> failed_operations_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> expired_{0};

    LatencyAverage read_latency_;
    LatencyAverage write_latency_;
    LatencyAverage delete_latency_;
    LatencyAverage query_latency_;
    mutable std::mutex latency_mutex_;
};

} // namespace flowstore
