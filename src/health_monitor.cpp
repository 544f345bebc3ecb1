// @src/health_monitor.cpp
#include "flowstore/health_monitor.h"
#include "flowstore/storage_engine.h"
#include "flowstore/debug_utils.h"

#include <iomanip>
#include <sstream>

namespace flowstore {

json HealthReport::toJson() const {
    return {
        {"healthy", healthy},
        {"timestamp", to_epoch_millis(timestamp)},
        {"testPassed", test_passed},
        {"issues", issues},
        {"memoryPressureDetected", memory_pressure_detected},
        {"stats", stats},
    };
}

HealthMonitor::HealthMonitor(HealthConfig config, StorageEngine* engine)
    : config_(config), engine_(engine) {}

SelfTestResult HealthMonitor::runSelfTest(TimePoint now) {
    SelfTestResult result;
    if (!engine_) {
        result.issues.push_back("Self-test failed: no engine attached");
        return result;
    }

    const auto start = std::chrono::steady_clock::now();
    const std::string key = SELF_TEST_KEY_PREFIX + std::to_string(to_epoch_millis(now)) + "_" +
                            std::to_string(self_test_sequence_.fetch_add(1, std::memory_order_relaxed));
    const json probe = {{"test", true}, {"timestamp", to_epoch_millis(now)}};

    try {
        engine_->set(key, probe);
        auto read_back = engine_->get(key);
        engine_->remove(key);

        if (!read_back) {
            result.issues.push_back("Self-test failed: written value could not be read back");
        } else if (*read_back != probe) {
            result.issues.push_back("Self-test failed: read value differs from written value");
        } else {
            result.test_passed = true;
        }
    } catch (const std::exception& e) {
        result.issues.push_back(std::string("Self-test failed: ") + e.what());
        try {
            engine_->remove(key);
        } catch (const std::exception& cleanup_error) {
            LOG_WARN("[HealthMonitor] Could not remove self-test key {}: {}", key, cleanup_error.what());
        }
    }

    result.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    if (!result.test_passed) {
        LOG_ERROR("[HealthMonitor] {}", result.issues.empty() ? std::string("Self-test failed") : result.issues.front());
    }
    return result;
}

bool HealthMonitor::memoryThresholdBreached(const HealthSnapshot& snapshot) const {
    return snapshot.memory_budget > 0 &&
           static_cast<double>(snapshot.memory_usage) > config_.max_memory_ratio * static_cast<double>(snapshot.memory_budget);
}

std::vector<std::string> HealthMonitor::evaluate(const HealthSnapshot& snapshot) const {
    std::vector<std::string> issues;
    auto percent = [](double ratio) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
        return oss.str();
    };

    if (snapshot.error_rate > config_.max_error_rate) {
        issues.push_back("High error rate: " + percent(snapshot.error_rate));
    }
    if (snapshot.cache_lookups > config_.min_cache_lookups && snapshot.cache_hit_rate < config_.min_cache_hit_rate) {
        issues.push_back("Low cache hit rate: " + percent(snapshot.cache_hit_rate));
    }
    if (memoryThresholdBreached(snapshot)) {
        issues.push_back("High memory usage: " +
                         percent(static_cast<double>(snapshot.memory_usage) / static_cast<double>(snapshot.memory_budget)));
    }
    return issues;
}

HealthReport HealthMonitor::buildReport(TimePoint now, const HealthSnapshot& snapshot, json stats) {
    HealthReport report;
    report.timestamp = now;
    report.stats = std::move(stats);

    if (config_.self_test_enabled) {
        SelfTestResult self_test = runSelfTest(now);
        report.test_passed = self_test.test_passed;
        report.issues = std::move(self_test.issues);
    } else {
        report.test_passed = true;
    }

    auto threshold_issues = evaluate(snapshot);
    report.issues.insert(report.issues.end(), threshold_issues.begin(), threshold_issues.end());
    report.memory_pressure_detected = memoryThresholdBreached(snapshot);
    report.healthy = report.test_passed && report.issues.empty();

    if (!report.healthy) {
        LOG_WARN("[HealthMonitor] Health check reported {} issue(s)", report.issues.size());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++checks_run_;
    if (!report.healthy) ++failed_checks_;
    last_report_ = report;
    return report;
}

std::optional<HealthReport> HealthMonitor::lastReport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_report_;
}

uint64_t HealthMonitor::checksRun() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checks_run_;
}

uint64_t HealthMonitor::failedChecks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_checks_;
}

} // namespace flowstore
