// @include/flowstore/resource_governor.h
#pragma once

#include "types.h"
#include "codec.h"
#include "cache.h"
#include "threading/system_monitor.h"

#include <memory>
#include <mutex>
#include <string>

namespace flowstore {

// Source of platform telemetry for the governor.
class ResourceProbe {
public:
    virtual ~ResourceProbe() = default;
    virtual ResourceState sample() = 0;
};

// Returns whatever state the caller last fed it.
class StaticResourceProbe : public ResourceProbe {
public:
    explicit StaticResourceProbe(ResourceState initial = {}) : state_(initial) {}

    void set(const ResourceState& state) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
    }
    ResourceState sample() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

private:
    ResourceState state_;
    std::mutex mutex_;
};

struct GovernorConfig {
    double enter_low_memory_pressure = 0.8;
    double exit_low_memory_pressure = 0.6;
    size_t low_memory_max_bytes = 25 * 1024 * 1024;
    size_t normal_batch_size = 50;
    size_t constrained_batch_size = 10;
    int low_battery_percent = 20;
    // Without an injected probe, sample the host through SystemResourceProbe.
    bool system_telemetry = false;
};

// Linux host telemetry. Network quality cannot be observed from here and is
// reported as whatever the embedder last set.
class SystemResourceProbe : public ResourceProbe {
public:
    explicit SystemResourceProbe(const GovernorConfig& config,
                                 std::string proc_root = "/proc",
                                 std::string sys_root = "/sys");

    void setNetworkQuality(NetworkQuality quality);
    ResourceState sample() override;

private:
    threading::SystemMonitor monitor_;
    int low_battery_percent_;
    NetworkQuality network_quality_ = NetworkQuality::GOOD;
    std::mutex mutex_;
};

// What the engine should do given the latest ResourceState.
struct ResourcePolicy {
    bool low_memory_mode = false;
    bool battery_optimization = false;
    double effective_pressure = 0.0;
    double cache_fraction = 0.3;
    size_t effective_max_memory = 0;
    size_t cache_budget = 0;
    CompressionPolicy compression;
    size_t wal_batch_size = 50;

    json toJson() const;
};

/**
 * @brief Turns resource telemetry into engine tuning.
 *
 * Low-memory mode is entered when effective pressure exceeds
 * enter_low_memory_pressure and left only once it falls below
 * exit_low_memory_pressure. Effective pressure is the larger of the sampled
 * host pressure and the engine's own usage relative to max_memory_size.
 * The governor is advisory; it never blocks an operation.
 */
class ResourceGovernor {
public:
    ResourceGovernor(GovernorConfig config,
                     cache::CacheConfig cache_config,
                     size_t max_memory_size,
                     std::shared_ptr<ResourceProbe> probe);

    // Asks the probe for fresh telemetry; without a probe the last pushed state is returned.
    ResourceState sampleEnvironment();

    ResourcePolicy applyPolicy(const ResourceState& state, size_t internal_usage_bytes);

    // Enters low-memory mode until pressure next drops below the exit threshold.
    ResourcePolicy forceLowMemory();

    ResourceState lastState() const;
    ResourcePolicy currentPolicy() const;
    bool lowMemoryMode() const;
    uint64_t modeTransitions() const;
    size_t maxMemorySize() const { return max_memory_size_; }
    const GovernorConfig& config() const { return config_; }

    json toJson() const;

private:
    ResourcePolicy computeLocked() const;

    GovernorConfig config_;
    cache::CacheConfig cache_config_;
    size_t max_memory_size_;
    std::shared_ptr<ResourceProbe> probe_;

    ResourceState last_state_;
    double effective_pressure_ = 0.0;
    bool low_memory_ = false;
    ResourcePolicy policy_;
    uint64_t transitions_ = 0;
    mutable std::mutex mutex_;
};

} // namespace flowstore
