#pragma once
#include <memory>
#include <string>
#include <vector>
#include "railguard/config/MonitorConfig.hpp"
#include "railguard/load/CpuUsageProbe.hpp"
#include "railguard/load/GpuLoadProbes.hpp"
#include "railguard/process/CommandRunner.hpp"

namespace railguard {
namespace load {

struct LoadReading {
    double cpuPercent = 0.0;
    double gpuPercent = 0.0;
    // Диагностика: значение подставлено как 0, потому что источник недоступен
    bool cpuFallback = false;
    bool gpuFallback = false;
    std::string gpuSource;  // имя сработавшей пробы, пусто при fallback
};

// Загрузка CPU/GPU. Никогда не бросает: недоступная метрика даёт 0
class ILoadSource {
public:
    virtual ~ILoadSource() = default;
    virtual LoadReading readLoads() = 0;
};

// Расположение источников загрузки, определяется один раз из конфигурации
struct LoadContext {
    std::string procStatPath = "/proc/stat";
    std::vector<std::string> gpuLoadPaths;
    std::chrono::milliseconds probeTimeout{2000};

    static LoadContext fromConfig(const config::MonitorConfig& config);
};

class SystemLoadSource : public ILoadSource {
public:
    SystemLoadSource(std::unique_ptr<CpuUsageProbe> cpuProbe,
                     std::vector<std::unique_ptr<IGpuLoadProbe>> gpuProbes);

    LoadReading readLoads() override;

    // Цепочка по умолчанию: nvidia-smi, tegrastats, sysfs, jtop
    static std::unique_ptr<SystemLoadSource> create(const LoadContext& context,
                                                    process::ICommandRunner& runner);

private:
    std::unique_ptr<CpuUsageProbe> cpuProbe_;
    std::vector<std::unique_ptr<IGpuLoadProbe>> gpuProbes_;
};

} // namespace load
} // namespace railguard
