// @src/test/resource_governor.test.cpp
#include "gtest/gtest.h"
#include "flowstore/resource_governor.h"
#include "flowstore/threading/system_monitor.h"

#include <filesystem>
#include <fstream>
#include <memory>

using namespace flowstore;

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxMemory = 50 * 1024 * 1024;

ResourceState pressureState(double pressure) {
    ResourceState state;
    state.memory_pressure = pressure;
    return state;
}

} // namespace

class ResourceGovernorTest : public ::testing::Test {
protected:
    ResourceGovernorTest() : governor(GovernorConfig{}, cache::CacheConfig{}, kMaxMemory, nullptr) {}

    ResourceGovernor governor;
};

TEST_F(ResourceGovernorTest, DefaultPolicyUsesNormalBudgets) {
    ResourcePolicy policy = governor.currentPolicy();
    EXPECT_FALSE(policy.low_memory_mode);
    EXPECT_EQ(policy.effective_max_memory, kMaxMemory);
    EXPECT_DOUBLE_EQ(policy.cache_fraction, 0.3);
    EXPECT_EQ(policy.cache_budget, static_cast<size_t>(kMaxMemory * 0.3));
    EXPECT_EQ(policy.wal_batch_size, 50u);
    EXPECT_FALSE(policy.compression.force_all_sizes);
}

TEST_F(ResourceGovernorTest, LowMemoryModeHasHysteresis) {
    EXPECT_FALSE(governor.applyPolicy(pressureState(0.8), 0).low_memory_mode); // must exceed, not equal
    EXPECT_TRUE(governor.applyPolicy(pressureState(0.85), 0).low_memory_mode);
    EXPECT_TRUE(governor.applyPolicy(pressureState(0.7), 0).low_memory_mode);
    EXPECT_TRUE(governor.applyPolicy(pressureState(0.6), 0).low_memory_mode);
    EXPECT_FALSE(governor.applyPolicy(pressureState(0.59), 0).low_memory_mode);
    EXPECT_EQ(governor.modeTransitions(), 2u);
}

TEST_F(ResourceGovernorTest, LowMemoryShrinksBudgetsAndForcesCompression) {
    ResourcePolicy policy = governor.applyPolicy(pressureState(0.95), 0);
    ASSERT_TRUE(policy.low_memory_mode);
    EXPECT_EQ(policy.effective_max_memory, 25u * 1024 * 1024);
    EXPECT_DOUBLE_EQ(policy.cache_fraction, 0.2);
    EXPECT_EQ(policy.cache_budget, static_cast<size_t>(25.0 * 1024 * 1024 * 0.2));
    EXPECT_TRUE(policy.compression.force_all_sizes);
}

TEST_F(ResourceGovernorTest, InternalUsageCountsAsPressure) {
    ResourcePolicy policy = governor.applyPolicy(pressureState(0.1), kMaxMemory * 9 / 10);
    EXPECT_TRUE(policy.low_memory_mode);
    EXPECT_NEAR(policy.effective_pressure, 0.9, 1e-6);
}

TEST_F(ResourceGovernorTest, BatteryConstraintShrinksBatches) {
    ResourceState state;
    state.battery_constrained = true;
    ResourcePolicy policy = governor.applyPolicy(state, 0);
    EXPECT_TRUE(policy.battery_optimization);
    EXPECT_FALSE(policy.low_memory_mode);
    EXPECT_EQ(policy.wal_batch_size, 10u);
    EXPECT_TRUE(policy.compression.force_all_sizes);
}

TEST_F(ResourceGovernorTest, ConstrainedNetworkImpliesBothModes) {
    ResourceState state;
    state.network_quality = NetworkQuality::CONSTRAINED;
    ResourcePolicy policy = governor.applyPolicy(state, 0);
    EXPECT_TRUE(policy.low_memory_mode);
    EXPECT_TRUE(policy.battery_optimization);
    EXPECT_EQ(policy.compression.network_quality, NetworkQuality::CONSTRAINED);
    EXPECT_EQ(policy.toJson()["networkQuality"], "CONSTRAINED");
}

TEST_F(ResourceGovernorTest, ForcedLowMemoryLastsUntilPressureDrops) {
    EXPECT_TRUE(governor.forceLowMemory().low_memory_mode);
    EXPECT_TRUE(governor.applyPolicy(pressureState(0.7), 0).low_memory_mode);
    EXPECT_FALSE(governor.applyPolicy(pressureState(0.2), 0).low_memory_mode);
}

TEST(ResourceGovernorSamplingTest, SampleEnvironmentReadsInjectedState) {
    auto probe = std::make_shared<StaticResourceProbe>();
    ResourceGovernor governor(GovernorConfig{}, cache::CacheConfig{}, kMaxMemory, probe);
    ResourceState state;
    state.memory_pressure = 0.42;
    state.network_quality = NetworkQuality::SLOW;
    probe->set(state);

    ResourceState sampled = governor.sampleEnvironment();
    EXPECT_DOUBLE_EQ(sampled.memory_pressure, 0.42);
    EXPECT_EQ(governor.lastState().network_quality, NetworkQuality::SLOW);
}

#ifdef __linux__
class SystemMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() /
               ("flowstore_sysmon_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root);
        fs::create_directories(root / "proc");
        fs::create_directories(root / "sys" / "class" / "power_supply" / "BAT0");
        fs::create_directories(root / "sys" / "class" / "power_supply" / "AC");
    }
    void TearDown() override { fs::remove_all(root); }

    void writeFile(const fs::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    fs::path root;
};

TEST_F(SystemMonitorTest, MemoryPressureFromMeminfo) {
    writeFile(root / "proc" / "meminfo", "MemTotal:       1000 kB\nMemFree:         100 kB\nMemAvailable:    250 kB\n");
    threading::SystemMonitor monitor((root / "proc").string(), (root / "sys").string());
    auto pressure = monitor.getMemoryPressure();
    ASSERT_TRUE(pressure.has_value());
    EXPECT_NEAR(*pressure, 0.75, 1e-9);
}

TEST_F(SystemMonitorTest, MissingMeminfoGivesNoReading) {
    threading::SystemMonitor monitor((root / "proc").string(), (root / "sys").string());
    EXPECT_FALSE(monitor.getMemoryPressure().has_value());
}

TEST_F(SystemMonitorTest, DischargingLowBatteryIsConstrained) {
    const fs::path bat = root / "sys" / "class" / "power_supply" / "BAT0";
    threading::SystemMonitor monitor((root / "proc").string(), (root / "sys").string());

    writeFile(bat / "status", "Discharging\n");
    writeFile(bat / "capacity", "15\n");
    EXPECT_TRUE(monitor.isBatteryConstrained(20));

    writeFile(bat / "capacity", "55\n");
    EXPECT_FALSE(monitor.isBatteryConstrained(20));

    writeFile(bat / "status", "Charging\n");
    writeFile(bat / "capacity", "5\n");
    EXPECT_FALSE(monitor.isBatteryConstrained(20));
}

TEST_F(SystemMonitorTest, HostTelemetryUsesConfiguredBatteryThreshold) {
    writeFile(root / "proc" / "meminfo", "MemTotal:       1000 kB\nMemFree:         100 kB\nMemAvailable:    400 kB\n");
    const fs::path bat = root / "sys" / "class" / "power_supply" / "BAT0";
    writeFile(bat / "status", "Discharging\n");
    writeFile(bat / "capacity", "30\n");

    GovernorConfig strict;
    strict.low_battery_percent = 20;
    SystemResourceProbe strict_probe(strict, (root / "proc").string(), (root / "sys").string());
    ResourceState state = strict_probe.sample();
    EXPECT_NEAR(state.memory_pressure, 0.6, 1e-9);
    EXPECT_FALSE(state.battery_constrained);
    EXPECT_EQ(state.network_quality, NetworkQuality::GOOD);

    GovernorConfig lenient;
    lenient.low_battery_percent = 40;
    SystemResourceProbe lenient_probe(lenient, (root / "proc").string(), (root / "sys").string());
    lenient_probe.setNetworkQuality(NetworkQuality::SLOW);
    state = lenient_probe.sample();
    EXPECT_TRUE(state.battery_constrained);
    EXPECT_EQ(state.network_quality, NetworkQuality::SLOW);
}

TEST_F(SystemMonitorTest, HostSamplingWithoutTelemetryReportsCalmHost) {
    GovernorConfig config;
    SystemResourceProbe probe(config, (root / "proc").string(), (root / "sys").string());
    ResourceState state = probe.sample();
    EXPECT_EQ(state.memory_pressure, 0.0);
    EXPECT_FALSE(state.battery_constrained);
}

TEST_F(SystemMonitorTest, GovernorSamplesHostTelemetry) {
    writeFile(root / "proc" / "meminfo", "MemTotal:       1000 kB\nMemFree:          10 kB\nMemAvailable:     50 kB\n");
    GovernorConfig config;
    auto probe = std::make_shared<SystemResourceProbe>(config, (root / "proc").string(), (root / "sys").string());
    ResourceGovernor governor(config, cache::CacheConfig{}, kMaxMemory, probe);

    ResourceState sampled = governor.sampleEnvironment();
    EXPECT_NEAR(sampled.memory_pressure, 0.95, 1e-9);
    EXPECT_TRUE(governor.applyPolicy(sampled, 0).low_memory_mode);
}
#endif
