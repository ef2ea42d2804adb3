#include "railguard/load/CpuUsageProbe.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>
#include <spdlog/spdlog.h>

namespace railguard {
namespace load {

CpuUsageProbe::CpuUsageProbe(std::string procStatPath) : procStatPath_(std::move(procStatPath)) {}

std::optional<double> CpuUsageProbe::sample() {
    std::ifstream statFile(procStatPath_);
    std::string line;
    if (!statFile || !std::getline(statFile, line)) {
        spdlog::debug("CpuUsageProbe: cannot read {}", procStatPath_);
        return std::nullopt;
    }

    std::istringstream iss(line);
    std::string cpu;
    iss >> cpu;
    std::vector<uint64_t> times;
    uint64_t value;
    while (iss >> value) {
        times.push_back(value);
    }
    if (cpu != "cpu" || times.size() < 4) {
        spdlog::debug("CpuUsageProbe: unexpected format in {}", procStatPath_);
        return std::nullopt;
    }

    uint64_t idle = times[3];
    uint64_t total = 0;
    for (auto t : times) total += t;

    if (!prevIdle_ || !prevTotal_) {
        prevIdle_ = idle;
        prevTotal_ = total;
        return 0.0;
    }

    double idleDelta = static_cast<double>(idle) - static_cast<double>(*prevIdle_);
    double totalDelta = static_cast<double>(total) - static_cast<double>(*prevTotal_);
    prevIdle_ = idle;
    prevTotal_ = total;

    if (totalDelta <= 0.0) {
        return 0.0;
    }
    double usage = 100.0 * (1.0 - idleDelta / totalDelta);
    return std::clamp(usage, 0.0, 100.0);
}

} // namespace load
} // namespace railguard
