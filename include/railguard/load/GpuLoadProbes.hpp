#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "railguard/process/CommandRunner.hpp"

namespace railguard {
namespace load {

// Один способ узнать загрузку GPU. Пробы опрашиваются по очереди до первого значения
class IGpuLoadProbe {
public:
    virtual ~IGpuLoadProbe() = default;
    virtual std::string name() const = 0;
    virtual std::optional<double> probe() = 0;
};

// nvidia-smi --query-gpu=utilization.gpu
class NvidiaSmiProbe : public IGpuLoadProbe {
public:
    NvidiaSmiProbe(process::ICommandRunner& runner, std::chrono::milliseconds timeout);
    std::string name() const override { return "nvidia-smi"; }
    std::optional<double> probe() override;

private:
    process::ICommandRunner& runner_;
    std::chrono::milliseconds timeout_;
};

// tegrastats на Jetson: запускается на короткое окно, из вывода берётся GR3D_FREQ
class TegrastatsProbe : public IGpuLoadProbe {
public:
    TegrastatsProbe(process::ICommandRunner& runner,
                    std::chrono::milliseconds window = std::chrono::milliseconds(300));
    std::string name() const override { return "tegrastats"; }
    std::optional<double> probe() override;

    static std::optional<double> parse(const std::string& output);

private:
    process::ICommandRunner& runner_;
    std::chrono::milliseconds window_;
};

// Файлы load в sysfs (gpu.0, devfreq). Используется первый существующий
class SysfsGpuLoadProbe : public IGpuLoadProbe {
public:
    explicit SysfsGpuLoadProbe(std::vector<std::string> paths);
    std::string name() const override { return "sysfs"; }
    std::optional<double> probe() override;

private:
    std::vector<std::string> paths_;
};

// jtop --json (jetson-stats), поле gpu.val
class JtopProbe : public IGpuLoadProbe {
public:
    JtopProbe(process::ICommandRunner& runner, std::chrono::milliseconds timeout);
    std::string name() const override { return "jtop"; }
    std::optional<double> probe() override;

    static std::optional<double> parse(const std::string& output);

private:
    process::ICommandRunner& runner_;
    std::chrono::milliseconds timeout_;
};

} // namespace load
} // namespace railguard
