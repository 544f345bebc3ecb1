// @include/flowstore/threading/system_monitor.h
#pragma once

#include <memory>
#include <optional>
#include <string>

namespace flowstore {
namespace threading {

/**
 * @class SystemMonitor
 * @brief Reads host memory and power telemetry.
 *
 * Uses the PImpl idiom to keep the platform-specific file handling out of
 * the header. On Linux the readings come from /proc/meminfo and
 * /sys/class/power_supply; other platforms report nothing.
 */
class SystemMonitor {
public:
    explicit SystemMonitor(std::string proc_root = "/proc", std::string sys_root = "/sys");
    ~SystemMonitor();

    SystemMonitor(const SystemMonitor&) = delete;
    SystemMonitor& operator=(const SystemMonitor&) = delete;

    /**
     * @brief System-wide memory pressure.
     * @return 1 - MemAvailable / MemTotal, between 0.0 and 1.0, or nullopt
     *         when the figures cannot be read.
     */
    std::optional<double> getMemoryPressure();

    /**
     * @brief Whether the machine is running on a low battery.
     * @return true when a battery is discharging at or below low_capacity_percent,
     *         false when no battery is present or it is charging.
     */
    bool isBatteryConstrained(int low_capacity_percent);

private:
    struct PImpl;
    std::unique_ptr<PImpl> pimpl_;
};

} // namespace threading
} // namespace flowstore
