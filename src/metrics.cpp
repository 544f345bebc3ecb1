// @src/metrics.cpp
#include "flowstore/metrics.h"

namespace flowstore {

void EngineMetrics::recordOperation(OperationKind kind, double duration_ms, bool failed) {
    if (failed) {
        failed_operations_.fetch_add(1, std::memory_order_relaxed);
    }
    std::lock_guard<std::mutex> lock(latency_mutex_);
    switch (kind) {
        case OperationKind::READ:
            reads_.fetch_add(1, std::memory_order_relaxed);
            read_latency_.add(duration_ms);
            break;
        case OperationKind::WRITE:
            writes_.fetch_add(1, std::memory_order_relaxed);
            write_latency_.add(duration_ms);
            break;
        case OperationKind::DELETE:
            deletes_.fetch_add(1, std::memory_order_relaxed);
            delete_latency_.add(duration_ms);
            break;
        case OperationKind::QUERY:
            queries_.fetch_add(1, std::memory_order_relaxed);
            query_latency_.add(duration_ms);
            break;
    }
}

double EngineMetrics::errorRate() const {
    uint64_t ops = totalOperations();
    return ops > 0 ? static_cast<double>(failedOperations()) / static_cast<double>(ops) : 0.0;
}

double EngineMetrics::cacheHitRate() const {
    uint64_t lookups = cacheLookups();
    return lookups > 0 ? static_cast<double>(cacheHits()) / static_cast<double>(lookups) : 0.0;
}

LatencyAverage EngineMetrics::latency(OperationKind kind) const {
    std::lock_guard<std::mutex> lock(latency_mutex_);
    switch (kind) {
        case OperationKind::READ: return read_latency_;
        case OperationKind::WRITE: return write_latency_;
        case OperationKind::DELETE: return delete_latency_;
        case OperationKind::QUERY: return query_latency_;
    }
    return {};
}

json EngineMetrics::operationsJson() const {
    return {
        {"reads", reads()},
        {"writes", writes()},
        {"deletes", deletes()},
        {"queries", queries()},
        {"cacheHits", cacheHits()},
        {"cacheMisses", cacheMisses()},
        {"errors", errors()},
        {"failedOperations", failedOperations()},
        {"retries", retries()},
        {"expired", expired()},
    };
}

json EngineMetrics::performanceJson() const {
    std::lock_guard<std::mutex> lock(latency_mutex_);
    auto entry = [](const LatencyAverage& l) {
        return json{{"count", l.samples}, {"avgMs", l.average_ms}, {"maxMs", l.max_ms}};
    };
    return {
        {"reads", entry(read_latency_)},
        {"writes", entry(write_latency_)},
        {"deletes", entry(delete_latency_)},
        {"queries", entry(query_latency_)},
        {"errorRate", errorRate()},
    };
}

} // namespace flowstore
