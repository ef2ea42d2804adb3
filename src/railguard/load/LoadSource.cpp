#include "railguard/load/LoadSource.hpp"
#include <algorithm>
#include <exception>
#include <spdlog/spdlog.h>

namespace railguard {
namespace load {

LoadContext LoadContext::fromConfig(const config::MonitorConfig& config) {
    LoadContext context;
    context.procStatPath = config.procStatPath;
    context.gpuLoadPaths = config.gpuLoadPaths;
    context.probeTimeout = config.probeTimeout;
    return context;
}

SystemLoadSource::SystemLoadSource(std::unique_ptr<CpuUsageProbe> cpuProbe,
                                   std::vector<std::unique_ptr<IGpuLoadProbe>> gpuProbes)
    : cpuProbe_(std::move(cpuProbe)), gpuProbes_(std::move(gpuProbes)) {}

std::unique_ptr<SystemLoadSource> SystemLoadSource::create(const LoadContext& context,
                                                           process::ICommandRunner& runner) {
    std::vector<std::unique_ptr<IGpuLoadProbe>> probes;
    probes.push_back(std::make_unique<NvidiaSmiProbe>(runner, context.probeTimeout));
    probes.push_back(std::make_unique<TegrastatsProbe>(runner));
    probes.push_back(std::make_unique<SysfsGpuLoadProbe>(context.gpuLoadPaths));
    probes.push_back(std::make_unique<JtopProbe>(runner, context.probeTimeout));
    return std::make_unique<SystemLoadSource>(
        std::make_unique<CpuUsageProbe>(context.procStatPath), std::move(probes));
}

LoadReading SystemLoadSource::readLoads() {
    LoadReading reading;

    std::optional<double> cpu;
    if (cpuProbe_) {
        cpu = cpuProbe_->sample();
    }
    if (cpu) {
        reading.cpuPercent = *cpu;
    } else {
        reading.cpuFallback = true;
        spdlog::debug("LoadSource: CPU usage unavailable, using 0%");
    }

    for (auto& probe : gpuProbes_) {
        std::optional<double> gpu;
        try {
            gpu = probe->probe();
        } catch (const std::exception& e) {
            spdlog::debug("LoadSource: {} failed: {}", probe->name(), e.what());
        }
        if (gpu) {
            reading.gpuPercent = std::clamp(*gpu, 0.0, 100.0);
            reading.gpuSource = probe->name();
            spdlog::debug("LoadSource: GPU usage from {}: {}%", probe->name(), reading.gpuPercent);
            return reading;
        }
        spdlog::trace("LoadSource: {} gave no GPU usage", probe->name());
    }

    reading.gpuFallback = true;
    spdlog::debug("LoadSource: GPU usage falling back to 0% (no method worked)");
    return reading;
}

} // namespace load
} // namespace railguard
