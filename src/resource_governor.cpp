// @src/resource_governor.cpp
#include "flowstore/resource_governor.h"
#include "flowstore/debug_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <algorithm>

namespace flowstore {

// --- SystemResourceProbe ---

SystemResourceProbe::SystemResourceProbe(const GovernorConfig& config, std::string proc_root, std::string sys_root)
    : monitor_(std::move(proc_root), std::move(sys_root)),
      low_battery_percent_(config.low_battery_percent) {}

void SystemResourceProbe::setNetworkQuality(NetworkQuality quality) {
    std::lock_guard<std::mutex> lock(mutex_);
    network_quality_ = quality;
}

ResourceState SystemResourceProbe::sample() {
    std::lock_guard<std::mutex> lock(mutex_);
    ResourceState state;
    state.memory_pressure = monitor_.getMemoryPressure().value_or(0.0);
    state.battery_constrained = monitor_.isBatteryConstrained(low_battery_percent_);
    state.network_quality = network_quality_;
    return state;
}

// --- ResourcePolicy ---

json ResourcePolicy::toJson() const {
    return {
        {"lowMemoryMode", low_memory_mode},
        {"batteryOptimization", battery_optimization},
        {"effectivePressure", effective_pressure},
        {"cacheFraction", cache_fraction},
        {"effectiveMaxMemory", effective_max_memory},
        {"cacheBudget", cache_budget},
        {"forceCompression", compression.force_all_sizes},
        {"networkQuality", std::string(magic_enum::enum_name(compression.network_quality))},
        {"walBatchSize", wal_batch_size},
    };
}

// --- ResourceGovernor ---

ResourceGovernor::ResourceGovernor(GovernorConfig config,
                                   cache::CacheConfig cache_config,
                                   size_t max_memory_size,
                                   std::shared_ptr<ResourceProbe> probe)
    : config_(config),
      cache_config_(cache_config),
      max_memory_size_(max_memory_size),
      probe_(std::move(probe)) {
    std::lock_guard<std::mutex> lock(mutex_);
    policy_ = computeLocked();
}

ResourceState ResourceGovernor::sampleEnvironment() {
    if (probe_) {
        ResourceState sampled = probe_->sample();
        std::lock_guard<std::mutex> lock(mutex_);
        last_state_ = sampled;
        return sampled;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return last_state_;
}

ResourcePolicy ResourceGovernor::applyPolicy(const ResourceState& state, size_t internal_usage_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_state_ = state;

    double internal = max_memory_size_ > 0
        ? static_cast<double>(internal_usage_bytes) / static_cast<double>(max_memory_size_)
        : 0.0;
    effective_pressure_ = std::clamp(std::max(state.memory_pressure, internal), 0.0, 1.0);

    bool was_low = low_memory_;
    if (!low_memory_ && effective_pressure_ > config_.enter_low_memory_pressure) {
        low_memory_ = true;
    } else if (low_memory_ && effective_pressure_ < config_.exit_low_memory_pressure) {
        low_memory_ = false;
    }
    if (was_low != low_memory_) {
        ++transitions_;
        LOG_INFO("[ResourceGovernor] {} low-memory mode at pressure {}",
                 low_memory_ ? "Entering" : "Leaving", effective_pressure_);
    }

    policy_ = computeLocked();
    return policy_;
}

ResourcePolicy ResourceGovernor::forceLowMemory() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!low_memory_) {
        low_memory_ = true;
        ++transitions_;
        LOG_WARN("[ResourceGovernor] Low-memory mode forced by health check");
    }
    policy_ = computeLocked();
    return policy_;
}

ResourcePolicy ResourceGovernor::computeLocked() const {
    ResourcePolicy policy;
    const bool constrained_network = last_state_.network_quality == NetworkQuality::CONSTRAINED;

    policy.effective_pressure = effective_pressure_;
    policy.low_memory_mode = low_memory_ || constrained_network;
    policy.battery_optimization = last_state_.battery_constrained || constrained_network;

    policy.effective_max_memory = policy.low_memory_mode
        ? std::min(max_memory_size_, config_.low_memory_max_bytes)
        : max_memory_size_;
    policy.cache_fraction = policy.low_memory_mode ? cache_config_.low_memory_fraction
                                                   : cache_config_.normal_fraction;
    policy.cache_budget = static_cast<size_t>(static_cast<double>(policy.effective_max_memory) * policy.cache_fraction);

    policy.compression.force_all_sizes = policy.low_memory_mode || policy.battery_optimization;
    policy.compression.network_quality = last_state_.network_quality;

    policy.wal_batch_size = policy.battery_optimization ? config_.constrained_batch_size
                                                        : config_.normal_batch_size;
    return policy;
}

ResourceState ResourceGovernor::lastState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_state_;
}

ResourcePolicy ResourceGovernor::currentPolicy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_;
}

bool ResourceGovernor::lowMemoryMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_.low_memory_mode;
}

uint64_t ResourceGovernor::modeTransitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transitions_;
}

json ResourceGovernor::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json out = policy_.toJson();
    out["memoryPressure"] = last_state_.memory_pressure;
    out["batteryConstrained"] = last_state_.battery_constrained;
    out["maxMemorySize"] = max_memory_size_;
    out["modeTransitions"] = transitions_;
    return out;
}

} // namespace flowstore
