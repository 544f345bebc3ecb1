// @src/threading/system_monitor.cpp
#include "flowstore/threading/system_monitor.h"
#include "flowstore/debug_utils.h"

#ifdef __linux__
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#endif

namespace flowstore {
namespace threading {

struct SystemMonitor::PImpl {
    std::string proc_root;
    std::string sys_root;
    bool warned_meminfo = false;
};

SystemMonitor::SystemMonitor(std::string proc_root, std::string sys_root)
    : pimpl_(std::make_unique<PImpl>()) {
    pimpl_->proc_root = std::move(proc_root);
    pimpl_->sys_root = std::move(sys_root);
}

SystemMonitor::~SystemMonitor() = default;

std::optional<double> SystemMonitor::getMemoryPressure() {
#ifdef __linux__
    std::ifstream meminfo(pimpl_->proc_root + "/meminfo");
    if (!meminfo) {
        if (!pimpl_->warned_meminfo) {
            LOG_WARN("[SystemMonitor] Cannot open {}/meminfo, memory pressure unavailable", pimpl_->proc_root);
            pimpl_->warned_meminfo = true;
        }
        return std::nullopt;
    }

    unsigned long long total_kb = 0;
    unsigned long long available_kb = 0;
    bool have_available = false;
    std::string line;
    while (std::getline(meminfo, line)) {
        std::istringstream iss(line);
        std::string label;
        unsigned long long value = 0;
        iss >> label >> value;
        if (label == "MemTotal:") {
            total_kb = value;
        } else if (label == "MemAvailable:") {
            available_kb = value;
            have_available = true;
        }
    }

    if (total_kb == 0 || !have_available) {
        return std::nullopt;
    }
    double pressure = 1.0 - static_cast<double>(available_kb) / static_cast<double>(total_kb);
    return std::clamp(pressure, 0.0, 1.0);
#else
    return std::nullopt;
#endif
}

bool SystemMonitor::isBatteryConstrained(int low_capacity_percent) {
#ifdef __linux__
    namespace fs = std::filesystem;
    const fs::path supplies = fs::path(pimpl_->sys_root) / "class" / "power_supply";
    std::error_code ec;
    if (!fs::is_directory(supplies, ec)) {
        return false;
    }

    for (const auto& dir : fs::directory_iterator(supplies, ec)) {
        if (dir.path().filename().string().rfind("BAT", 0) != 0) {
            continue;
        }
        std::ifstream status_file(dir.path() / "status");
        std::ifstream capacity_file(dir.path() / "capacity");
        if (!status_file || !capacity_file) {
            continue;
        }
        std::string status;
        int capacity = 100;
        std::getline(status_file, status);
        capacity_file >> capacity;
        if (status == "Discharging" && capacity <= low_capacity_percent) {
            return true;
        }
    }
    return false;
#else
    (void)low_capacity_percent;
    return false;
#endif
}

} // namespace threading
} // namespace flowstore
