// @include/flowstore/health_monitor.h
#pragma once

#include "types.h"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flowstore {

class StorageEngine; // Forward declaration

struct HealthConfig {
    double max_error_rate = 0.1;
    double min_cache_hit_rate = 0.3;
    uint64_t min_cache_lookups = 100; // hit rate is only judged past this many lookups
    double max_memory_ratio = 0.9;
    bool self_test_enabled = true;
};

// Counters the threshold checks look at.
struct HealthSnapshot {
    double error_rate = 0.0;
    double cache_hit_rate = 0.0;
    uint64_t cache_lookups = 0;
    size_t memory_usage = 0;
    size_t memory_budget = 0;
};

struct SelfTestResult {
    bool test_passed = false;
    std::vector<std::string> issues;
    double duration_ms = 0.0;
};

struct HealthReport {
    bool healthy = true;
    TimePoint timestamp{};
    bool test_passed = false;
    std::vector<std::string> issues;
    bool memory_pressure_detected = false;
    json stats = json::object();

    json toJson() const;
};

/**
 * @class HealthMonitor
 * @brief Self-test round trip plus threshold checks over engine counters.
 *
 * The monitor never halts the engine; an unhealthy report is the only
 * outcome of a failed check.
 */
class HealthMonitor {
public:
    static constexpr const char* SELF_TEST_KEY_PREFIX = "__flowstore_health_check_";

    HealthMonitor(HealthConfig config, StorageEngine* engine);

    // Writes, reads back, and deletes a synthetic key through the engine.
    // Every run uses its own key, so concurrent runs never share a record.
    SelfTestResult runSelfTest(TimePoint now);

    // Issue messages for every breached threshold.
    std::vector<std::string> evaluate(const HealthSnapshot& snapshot) const;
    bool memoryThresholdBreached(const HealthSnapshot& snapshot) const;

    HealthReport buildReport(TimePoint now, const HealthSnapshot& snapshot, json stats);

    std::optional<HealthReport> lastReport() const;
    uint64_t checksRun() const;
    uint64_t failedChecks() const;
    const HealthConfig& config() const { return config_; }

private:
    HealthConfig config_;
    StorageEngine* engine_;

    std::atomic<uint64_t> self_test_sequence_{0};
    std::optional<HealthReport> last_report_;
    uint64_t checks_run_ = 0;
    uint64_t failed_checks_ = 0;
    mutable std::mutex mutex_;
};

} // namespace flowstore
